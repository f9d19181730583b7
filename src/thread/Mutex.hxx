// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef THREAD_MUTEX_HXX
#define THREAD_MUTEX_HXX

#include <mutex>

using Mutex = std::mutex;

#endif
