#pragma once

#define GLIFZIP_VERSION "1.0.0"
#define GLIFZIP_PROGRAM_NAME "glifzip"
