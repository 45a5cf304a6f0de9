/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#if !defined(NDEBUG) && !defined(_DEBUG)
#define _DEBUG
#endif

#include "atproto/at_uri.h"
#include "car_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "utils/string_utils.h"
