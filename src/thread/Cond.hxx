// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef THREAD_COND_HXX
#define THREAD_COND_HXX

#include <condition_variable>

using Cond = std::condition_variable;

#endif
