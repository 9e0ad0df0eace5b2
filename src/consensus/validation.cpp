// VINDEX - Validation State Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/consensus/validation.h"

namespace vindex {
namespace consensus {

std::string ValidationState::ToString() const {
    if (IsValid()) {
        return "VALID";
    }
    std::string result = IsError() ? "ERROR: " : "INVALID: ";
    result += rejectReason_;
    if (!debugMessage_.empty()) {
        result += " (" + debugMessage_ + ")";
    }
    return result;
}

} // namespace consensus
} // namespace vindex
