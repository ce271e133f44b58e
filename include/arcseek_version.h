// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

// Normally injected by the build from project(VERSION ...)
#ifndef ARCSEEK_VERSION
#define ARCSEEK_VERSION "0.0.0-dev"
#endif
