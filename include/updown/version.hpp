#pragma once

#define UPDOWN_VERSION "v1.0"
