#define ET_CLASS "EasyTimerError"
// #define ET_LOG_DEV_LEVEL 3

#include "EasyTimerErrors.hpp"

/* Class variables. */

thread_local char EasyTimerError::buffer[EasyTimerError::bufferSize];
