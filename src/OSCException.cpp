#include <unordered_map>

#include "oscwire/Exceptions.h"

namespace oscwire {
    // Static method to get a description for an error code
    std::string OSCException::getErrorDescription(ErrorCode code) {
        static const std::unordered_map<ErrorCode, std::string> descriptions = {
            {ErrorCode::None, "No error"},
            {ErrorCode::MalformedPacket, "Malformed OSC packet"},
            {ErrorCode::MissingTypeTagComma, "Missing ',' before the type-tag string"},
            {ErrorCode::MisalignedAddress, "OSC address is not aligned to 4 bytes"},
            {ErrorCode::MissingNullTerminator, "Missing null terminator"},
            {ErrorCode::UnknownTypeTag, "Unknown OSC type tag"},
            {ErrorCode::NestedArraysUnsupported, "Nested arrays are not supported"},
            {ErrorCode::UnbalancedArray, "Unbalanced array brackets"},
            {ErrorCode::NotABundle, "Not an OSC bundle"},
            {ErrorCode::TruncatedBundle, "Truncated OSC bundle"},
            {ErrorCode::TruncatedArgument, "Truncated OSC argument"},
            {ErrorCode::AddressError, "Invalid OSC address"},
            {ErrorCode::TypeMismatch, "OSC type mismatch"},
            {ErrorCode::InvalidArgument, "Invalid argument"},
            {ErrorCode::MessageTooLarge, "Size exceeds maximum allowed size"},
            {ErrorCode::ConfigurationError, "Invalid configuration"}};

        auto it = descriptions.find(code);
        if (it != descriptions.end()) {
            return it->second;
        }

        return "Unknown error";
    }
}  // namespace oscwire
