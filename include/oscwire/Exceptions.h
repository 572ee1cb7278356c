/*
 *  OSCWire - Open Sound Control wire codec.
 *  This file defines exceptions used throughout the OSCWire library.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace oscwire {
    /**
     * @brief Base exception class for all OSCWire errors
     *
     * Every failure raised by the codec carries an ErrorCode so callers can
     * tell the error kinds apart without parsing the message text.
     */
    class OSCException : public std::runtime_error {
       public:
        /**
         * @brief Error codes for OSC exceptions
         */
        enum class ErrorCode {
            None = 0,
            MalformedPacket,          ///< Empty packet or invalid length field
            MissingTypeTagComma,      ///< No ',' found after the address
            MisalignedAddress,        ///< Address is not padded to a 4-byte boundary
            MissingNullTerminator,    ///< Type-tag string or string argument is unterminated
            UnknownTypeTag,           ///< Unsupported OSC type tag character
            NestedArraysUnsupported,  ///< Array nested inside another array
            UnbalancedArray,          ///< Unmatched '[' or ']'
            NotABundle,               ///< Packet starts with '#' but is not "#bundle"
            TruncatedBundle,          ///< Bundle element exceeds remaining bytes
            TruncatedArgument,        ///< Argument payload exceeds remaining bytes
            AddressError,             ///< Invalid OSC address
            TypeMismatch,             ///< Typed accessor used on the wrong variant
            InvalidArgument,          ///< Invalid caller-supplied value
            MessageTooLarge,          ///< Packet or blob exceeds the configured limit
            ConfigurationError        ///< Configuration could not be loaded
        };

        /**
         * @brief Construct a new OSC Exception
         * @param message Error message
         * @param code Error code
         */
        OSCException(const std::string &message, ErrorCode code = ErrorCode::None)
            : std::runtime_error(message), code_(code) {}

        /**
         * @brief Get the error code
         * @return ErrorCode
         */
        ErrorCode code() const { return code_; }

        /**
         * @brief Get a description for an error code
         * @param code The error code
         * @return std::string The description
         */
        static std::string getErrorDescription(ErrorCode code);

       private:
        ErrorCode code_;
    };

    /**
     * @brief Exception for malformed packets
     */
    class MalformedPacketException : public OSCException {
       public:
        MalformedPacketException(const std::string &message,
                                 ErrorCode code = ErrorCode::MalformedPacket)
            : OSCException(message, code) {}
    };

    /**
     * @brief Exception for type mismatches
     */
    class TypeMismatchException : public OSCException {
       public:
        TypeMismatchException(const std::string &message)
            : OSCException(message, ErrorCode::TypeMismatch) {}
    };

    /**
     * @brief Exception for address errors
     */
    class AddressException : public OSCException {
       public:
        AddressException(const std::string &message)
            : OSCException(message, ErrorCode::AddressError) {}
    };

    /**
     * @brief Exception for invalid arguments
     */
    class InvalidArgumentException : public OSCException {
       public:
        InvalidArgumentException(const std::string &message,
                                 ErrorCode code = ErrorCode::InvalidArgument)
            : OSCException(message, code) {}
    };

    /**
     * @brief Exception for packet or blob size errors
     */
    class MessageSizeException : public OSCException {
       public:
        MessageSizeException(const std::string &message)
            : OSCException(message, ErrorCode::MessageTooLarge) {}
    };

}  // namespace oscwire
