/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

/**
 * Marks a pointer that may be `nullptr`, e.g
 *
 *   const Kind* TF_NULLABLE find(const std::string& name) const;
 *
 * Only clang checks it.
 */
#if defined(__clang__) && defined(__has_feature)
#if __has_feature(nullability)
#define TF_NULLABLE _Nullable
#endif
#endif

#ifndef TF_NULLABLE
#define TF_NULLABLE
#endif
