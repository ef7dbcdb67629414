// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <errno.h>

#ifndef __ELASTERROR
#	define __ELASTERROR 2000 // Users can add values starting here.
#endif

/**
 * The backend exited, closed its diagnostic stream, or timed out before it
 * announced an endpoint.
 */
#define EBACKENDSTARTUP (__ELASTERROR + 1)
/**
 * The device reported that a cycle-counter read produced an impossible value
 * (the end of a measurement was before its start).
 */
#define ECOUNTERFAULT (__ELASTERROR + 2)
