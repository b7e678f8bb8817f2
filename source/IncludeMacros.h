/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#define INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Class) \
  Class(const Class&) = default;                                 \
  Class(Class&&) = default;                                      \
  Class& operator=(const Class&) = default;                      \
  Class& operator=(Class&&) = default;                           \
  ~Class() = default;

#define DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Class) \
  Class(const Class&) = delete;                         \
  Class(Class&&) = delete;                              \
  Class& operator=(const Class&) = delete;              \
  Class& operator=(Class&&) = delete;                   \
  ~Class() = default;

#define MOVE_CONSTRUCTOR_ONLY(Class)            \
  Class(const Class&) = delete;                 \
  Class(Class&&) = default;                     \
  Class& operator=(const Class&) = delete;      \
  Class& operator=(Class&&) = delete;           \
  ~Class() = default;
