// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider_error.hpp"

#include <magic_enum.hpp>

namespace snapjar::db::chain {

ProviderException::ProviderException(ProviderError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Provider error : " + std::string{magic_enum::enum_name(err)}
                          : message + " : " + std::string{magic_enum::enum_name(err)}},
      err_{err} {}

ExecutionException::ExecutionException(ValidationError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Validation error : " + std::string{magic_enum::enum_name(err)}
                          : message + " : " + std::string{magic_enum::enum_name(err)}},
      err_{err} {}

}  // namespace snapjar::db::chain
