/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

// Boost.JSON is used in its header-only mode: its implementation is compiled exactly once here.
#include <boost/json/src.hpp>
