#pragma once

// POSIX types missing from MSVC

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <BaseTsd.h>
typedef SSIZE_T ssize_t;
#else
#include <sys/types.h>
#endif
