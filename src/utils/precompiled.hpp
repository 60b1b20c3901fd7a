/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_PRECOMPILED_HPP_INCLUDED__
#define __ZSOCK_PRECOMPILED_HPP_INCLUDED__

#define __STDC_LIMIT_MACROS

// zsock definitions and exported functions
#include "zsock.h"

#include <errno.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

#include <new>
#include <string>
#include <vector>

#endif
