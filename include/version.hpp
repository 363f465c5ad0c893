#pragma once

#define CHUNKVAULT_NAME "chunkvault"
#define CHUNKVAULT_VERSION "0.4.0"
