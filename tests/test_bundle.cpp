#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "TestUtils.h"
#include "oscwire/Bundle.h"

using namespace oscwire;
using oscwire::test::append;
using oscwire::test::bytesOf;
using oscwire::test::errorCodeOf;
using ErrorCode = OSCException::ErrorCode;

namespace {
    // "/foo" with a single int32 argument, 12 bytes on the wire
    std::vector<std::byte> fooMessage(int value) {
        auto bytes = bytesOf("/foo,i\0\0");
        append(bytes, bytesOf({0, 0, 0, value}));
        return bytes;
    }

    std::vector<std::byte> bundleHeader(uint64_t timeTag) {
        auto bytes = bytesOf("#bundle\0");
        for (int shift = 56; shift >= 0; shift -= 8) {
            bytes.push_back(static_cast<std::byte>((timeTag >> shift) & 0xFF));
        }
        return bytes;
    }

    ErrorCode decodeError(const std::vector<std::byte> &bytes) {
        return errorCodeOf([&] { Bundle::deserialize(bytes.data(), bytes.size()); });
    }
}  // namespace

TEST(Bundle, Creation) {
    Bundle bundle(TimeTag::immediate());
    EXPECT_TRUE(bundle.isEmpty());
    EXPECT_EQ(bundle.size(), 0u);
    EXPECT_TRUE(bundle.getTimeTag().isImmediate());

    Message msg("/test");
    msg.addInt32(42);
    bundle.addMessage(msg).addMessage(Message("/other"));
    EXPECT_EQ(bundle.size(), 2u);
    EXPECT_EQ(bundle.messages()[0], msg);
}

TEST(Bundle, SingleElementWireFormat) {
    auto expected = bundleHeader(1);
    append(expected, bytesOf({0, 0, 0, 12}));
    append(expected, fooMessage(42));
    ASSERT_EQ(expected.size(), 32u);

    Bundle decoded = Bundle::deserialize(expected.data(), expected.size());
    EXPECT_EQ(decoded.getTimeTag().toNTP(), 1u);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded.messages()[0].getPath(), "/foo");
    EXPECT_EQ(decoded.messages()[0].getArgument(0).asInt32(), 42);

    Message foo("/foo");
    foo.addInt32(42);
    Bundle built(TimeTag(uint64_t{1}), {foo});
    EXPECT_EQ(decoded, built);
    EXPECT_EQ(built.serialize(), expected);
}

TEST(Bundle, EmptyBundle) {
    Bundle bundle(TimeTag(uint64_t{0x0000000200000000ull}));
    std::vector<std::byte> bytes = bundle.serialize();
    EXPECT_EQ(bytes, bundleHeader(0x0000000200000000ull));

    Bundle decoded = Bundle::deserialize(bytes.data(), bytes.size());
    EXPECT_TRUE(decoded.isEmpty());
    EXPECT_EQ(decoded.getTimeTag().seconds(), 2u);
}

TEST(Bundle, ElementOrderIsPreserved) {
    Bundle bundle(TimeTag(3900000000u, 0));
    for (int i = 0; i < 5; ++i) {
        Message msg("/ch/" + std::to_string(i));
        msg.addInt32(i).addString(std::string(static_cast<size_t>(i), 'x'));
        bundle.addMessage(msg);
    }

    std::vector<std::byte> bytes = bundle.serialize();
    EXPECT_EQ(bytes.size() % 4, 0u);

    Bundle decoded = Bundle::deserialize(bytes.data(), bytes.size());
    EXPECT_EQ(decoded, bundle);

    std::vector<std::string> paths;
    decoded.forEach([&paths](const Message &msg) { paths.push_back(msg.getPath()); });
    EXPECT_EQ(paths, (std::vector<std::string>{"/ch/0", "/ch/1", "/ch/2", "/ch/3", "/ch/4"}));
}

TEST(Bundle, UnalignedElementSizeIsRealigned) {
    // The first element declares 13 bytes; the next size field starts on the
    // following 4-byte boundary.
    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0, 0, 0, 13}));
    append(bytes, fooMessage(1));
    append(bytes, bytesOf({0, 0, 0, 0}));
    append(bytes, bytesOf({0, 0, 0, 12}));
    append(bytes, fooMessage(2));

    Bundle decoded = Bundle::deserialize(bytes.data(), bytes.size());
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded.messages()[0].getArgument(0).asInt32(), 1);
    EXPECT_EQ(decoded.messages()[1].getArgument(0).asInt32(), 2);
}

TEST(Bundle, WrongIdentifierIsNotABundle) {
    auto bytes = bytesOf("#bundlX\0");
    append(bytes, bytesOf({0, 0, 0, 0, 0, 0, 0, 1}));
    EXPECT_EQ(decodeError(bytes), ErrorCode::NotABundle);

    EXPECT_EQ(decodeError(bytesOf("#bun")), ErrorCode::NotABundle);
}

TEST(Bundle, MissingTimeTagIsTruncated) {
    auto bytes = bytesOf("#bundle\0");
    append(bytes, bytesOf({0, 0, 0, 0}));
    EXPECT_EQ(decodeError(bytes), ErrorCode::TruncatedBundle);
}

TEST(Bundle, OverlongElementIsTruncated) {
    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0, 0, 0, 100}));
    append(bytes, fooMessage(42));
    EXPECT_EQ(decodeError(bytes), ErrorCode::TruncatedBundle);
}

TEST(Bundle, PartialSizeFieldIsTruncated) {
    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0, 0}));
    EXPECT_EQ(decodeError(bytes), ErrorCode::TruncatedBundle);
}

TEST(Bundle, NegativeElementSizeIsMalformed) {
    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0xFF, 0xFF, 0xFF, 0xF0}));
    append(bytes, fooMessage(42));
    EXPECT_EQ(decodeError(bytes), ErrorCode::MalformedPacket);
}

TEST(Bundle, ElementErrorKeepsItsCode) {
    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0, 0, 0, 12}));
    append(bytes, fooMessage(42));
    append(bytes, bytesOf({0, 0, 0, 8}));
    append(bytes, bytesOf("/foo,x\0\0"));

    try {
        Bundle::deserialize(bytes.data(), bytes.size());
        FAIL() << "Expected an exception";
    } catch (const OSCException &e) {
        EXPECT_EQ(e.code(), ErrorCode::UnknownTypeTag);
        EXPECT_NE(std::string(e.what()).find("bundled message 1"), std::string::npos);
    }
}

TEST(Bundle, NestedBundleIsRejected) {
    Message inner("/foo");
    inner.addInt32(42);
    std::vector<std::byte> innerBytes = Bundle(TimeTag(uint64_t{1}), {inner}).serialize();

    auto bytes = bundleHeader(1);
    append(bytes, bytesOf({0, 0, 0, static_cast<int>(innerBytes.size())}));
    append(bytes, innerBytes);
    EXPECT_EQ(decodeError(bytes), ErrorCode::AddressError);
}

TEST(Bundle, EncodingFailureInAnyElementFails) {
    Message good("/ok");
    Message bad("/bad");
    bad.addString(std::string("\0", 1));

    Bundle bundle;
    bundle.addMessage(good).addMessage(bad);
    EXPECT_EQ(errorCodeOf([&] { bundle.serialize(); }), ErrorCode::InvalidArgument);
}

TEST(Bundle, ElementLargerThanTheLimitIsNotFramed) {
    Message foo("/foo");
    foo.addInt32(42);
    Bundle bundle(TimeTag(uint64_t{1}), {foo});

    CodecOptions options;
    options.maxPacketSize = 8;
    try {
        bundle.serialize(options);
        FAIL() << "Expected an exception";
    } catch (const MessageSizeException &e) {
        EXPECT_NE(std::string(e.what()).find("Bundle element of 12 bytes"), std::string::npos);
    }
}

TEST(Bundle, WholeBundleIsCheckedAgainstThePacketLimit) {
    Message foo("/foo");
    foo.addInt32(42);
    Bundle bundle(TimeTag(uint64_t{1}), {foo});

    CodecOptions options;
    options.maxPacketSize = 31;
    EXPECT_EQ(errorCodeOf([&] { bundle.serialize(options); }), ErrorCode::MessageTooLarge);

    options.maxPacketSize = 32;
    EXPECT_EQ(bundle.serialize(options).size(), 32u);
}

TEST(Bundle, ElementErrorsKeepTheirExceptionType) {
    auto unknownTag = bundleHeader(1);
    append(unknownTag, bytesOf({0, 0, 0, 8}));
    append(unknownTag, bytesOf("/foo,x\0\0"));
    EXPECT_THROW(Bundle::deserialize(unknownTag.data(), unknownTag.size()),
                 MalformedPacketException);

    auto badAddress = bundleHeader(1);
    append(badAddress, bytesOf({0, 0, 0, 8}));
    append(badAddress, bytesOf("foo\0,\0\0\0"));
    EXPECT_THROW(Bundle::deserialize(badAddress.data(), badAddress.size()), AddressException);

    std::vector<std::byte> payload(16, std::byte{0});
    Message blob("/blob");
    blob.addBlob(payload.data(), payload.size());
    std::vector<std::byte> bytes = Bundle(TimeTag(uint64_t{1}), {blob}).serialize();

    CodecOptions options;
    options.maxBlobSize = 8;
    EXPECT_THROW(Bundle::deserialize(bytes.data(), bytes.size(), options), MessageSizeException);
}
