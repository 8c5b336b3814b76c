#pragma once

#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
