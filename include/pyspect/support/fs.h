/***
 * Name: pyspect::support (fs)
 * Purpose: Minimal file IO helpers for reading scripts and writing results.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 *   Both directions are binary so script bytes reach the hasher unmodified.
 */
#pragma once

#include <string>

namespace pyspect {
namespace support {

/*** ReadFile: Read entire file (raw bytes) into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace pyspect
