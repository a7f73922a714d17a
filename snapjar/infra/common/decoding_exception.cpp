// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_exception.hpp"

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

namespace snapjar {

DecodingException::DecodingException(DecodingError err, std::string_view context)
    : std::runtime_error{absl::StrCat(context, ": ", magic_enum::enum_name(err))}, err_{err} {}

}  // namespace snapjar
