// Copyright 2025 The Restrack Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#ifndef RESTRACK_DISALLOW_COPY_AND_ASSIGN
#define RESTRACK_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName &) = delete;              \
  void operator=(const TypeName &) = delete
#endif

#define RESTRACK_UNUSED(x) (void)x

#if defined(__GNUC__)
#define RESTRACK_PREDICT_FALSE(x) (__builtin_expect(x, 0))
#define RESTRACK_PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))
#define RESTRACK_NORETURN __attribute__((noreturn))
#else
#define RESTRACK_PREDICT_FALSE(x) x
#define RESTRACK_PREDICT_TRUE(x) x
#define RESTRACK_NORETURN
#endif

#if defined(__GNUC__) || defined(__APPLE__)
#define RESTRACK_MUST_USE_RESULT __attribute__((warn_unused_result))
#else
#define RESTRACK_MUST_USE_RESULT
#endif

#define RESTRACK_CONCAT_IMPL(x, y) x##y
#define RESTRACK_CONCAT(x, y) RESTRACK_CONCAT_IMPL(x, y)

// Expands to a variable name that is unique within the enclosing scope.
#define RESTRACK_UNIQUE_VARIABLE(base) RESTRACK_CONCAT(base, __LINE__)
