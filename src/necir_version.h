#pragma once

#define NECIR_VERSION_MAJOR 1
#define NECIR_VERSION_MINOR 0
#define NECIR_VERSION_PATCH 0
#define NECIR_VERSION_STR "1.0.0"
