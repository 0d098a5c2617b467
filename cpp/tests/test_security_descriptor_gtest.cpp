// ==============================================================================
// test_security_descriptor_gtest.cpp - Unit tests for the Security Descriptor codec
// ==============================================================================
//
// Tests:
// TST-SD-001: Decode_Header
// TST-SD-002: Decode_OwnerOnly
// TST-SD-003: Decode_Full
// TST-SD-004: Encode_RoundTrip
// TST-SD-005: Offset_OutOfBounds
// TST-SD-006: Truncated_Buffer
// TST-SD-007: DaclPresent_Without_Offset
// TST-SD-008: Offset_Without_Flag
// TST-SD-009: Revision_Handling
// TST-SD-010: Decode_Inside_Larger_Buffer
// TST-SD-011: Encode_Built_Descriptor
// TST-SD-012: Control_Flag_Names
// TST-SD-013: Diagnostics_Logged
// TST-SD-014: Built_Defaults_RoundTrip
//
// ==============================================================================

#include <cstdio>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <winstructs/output.hpp>
#include <winstructs/security_descriptor.hpp>

namespace winstructs::security {

// ============================================================================
// Test Fixture
// ============================================================================

class SecurityDescriptorTest : public ::testing::Test {
protected:
    std::vector<std::uint8_t> system_sid_ = {0x01, 0x01, 0x00, 0x00, 0x00, 0x00,
                                             0x00, 0x05, 0x12, 0x00, 0x00, 0x00};

    std::vector<std::uint8_t> admins_sid_ = {0x01, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x05,
                                             0x20, 0x00, 0x00, 0x00, 0x20, 0x02, 0x00, 0x00};

    /// DACL: ACCESS_ALLOWED S-1-5-18, ACCESS_DENIED (inherited) S-1-5-32-545
    std::vector<std::uint8_t> dacl_ = {
        0x02, 0x00, 0x34, 0x00, 0x02, 0x00, 0x00, 0x00,                          // header
        0x00, 0x03, 0x14, 0x00, 0xFF, 0x01, 0x1F, 0x00, 0x01, 0x01, 0x00, 0x00,  // ACE 1
        0x00, 0x00, 0x00, 0x05, 0x12, 0x00, 0x00, 0x00,                          //
        0x01, 0x10, 0x18, 0x00, 0x3F, 0x00, 0x0F, 0x00, 0x01, 0x02, 0x00, 0x00,  // ACE 2
        0x00, 0x00, 0x00, 0x05, 0x20, 0x00, 0x00, 0x00, 0x21, 0x02, 0x00, 0x00};

    static void put_u32(std::vector<std::uint8_t>& data, std::size_t pos, std::uint32_t value) {
        for (std::size_t i = 0; i < 4; ++i) {
            data[pos + i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
        }
    }

    static std::vector<std::uint8_t> header(std::uint16_t control, std::uint32_t owner,
                                            std::uint32_t group, std::uint32_t sacl,
                                            std::uint32_t dacl) {
        std::vector<std::uint8_t> data(SD_HEADER_SIZE, 0);
        data[0] = SD_REVISION;
        data[2] = static_cast<std::uint8_t>(control & 0xFF);
        data[3] = static_cast<std::uint8_t>(control >> 8);
        put_u32(data, 4, owner);
        put_u32(data, 8, group);
        put_u32(data, 12, sacl);
        put_u32(data, 16, dacl);
        return data;
    }

    /// Owner at 20, group at 32, DACL at 48 (100 bytes)
    std::vector<std::uint8_t> full_sd() const {
        auto data = header(0x8004, 20, 32, 0, 48);
        data.insert(data.end(), system_sid_.begin(), system_sid_.end());
        data.insert(data.end(), admins_sid_.begin(), admins_sid_.end());
        data.insert(data.end(), dacl_.begin(), dacl_.end());
        return data;
    }

    std::vector<std::uint8_t> owner_only_sd() const {
        auto data = header(0x8000, 20, 0, 0, 0);
        data.insert(data.end(), system_sid_.begin(), system_sid_.end());
        return data;
    }

    static const SecurityDescriptor& value(const DecodeResult<SecurityDescriptor>& result) {
        return std::get<SecurityDescriptor>(result);
    }
    static const DecodeError& error(const DecodeResult<SecurityDescriptor>& result) {
        return std::get<DecodeError>(result);
    }
};

// ============================================================================
// TST-SD-001: Decode_Header
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_001_Decode_Header) {
    std::vector<std::uint8_t> data = {0x01, 0x00, 0x04, 0x98, 0x98, 0x00, 0x00,
                                      0x00, 0xA4, 0x00, 0x00, 0x00, 0x00, 0x00,
                                      0x00, 0x00, 0x14, 0x00, 0x00, 0x00};
    auto result = decode_security_descriptor_header(data);
    ASSERT_TRUE(std::holds_alternative<SecurityDescriptorHeader>(result));

    const auto& header = std::get<SecurityDescriptorHeader>(result);
    EXPECT_EQ(header.revision, 1);
    EXPECT_EQ(header.control, 0x9804);
    EXPECT_TRUE(header.has_control(SdControlFlags::DaclPresent));
    EXPECT_TRUE(header.has_control(SdControlFlags::SelfRelative));
    EXPECT_FALSE(header.has_control(SdControlFlags::SaclPresent));
    EXPECT_EQ(header.owner_offset, 152u);
    EXPECT_EQ(header.group_offset, 164u);
    EXPECT_EQ(header.sacl_offset, 0u);
    EXPECT_EQ(header.dacl_offset, 20u);

    auto truncated = decode_security_descriptor_header(data.data(), 19);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(truncated));
    EXPECT_EQ(std::get<DecodeError>(truncated).kind, DecodeErrorKind::OutOfBounds);
}

// ============================================================================
// TST-SD-002: Decode_OwnerOnly
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_002_Decode_OwnerOnly) {
    auto data = owner_only_sd();
    std::vector<Anomaly> anomalies;
    auto result = decode_security_descriptor(data, DecodeOptions{}, &anomalies);

    ASSERT_TRUE(succeeded(result));
    EXPECT_TRUE(anomalies.empty());
    const auto& sd = value(result);
    ASSERT_TRUE(sd.owner.has_value());
    EXPECT_EQ(sd.owner->to_string(), "S-1-5-18");
    EXPECT_FALSE(sd.group.has_value());
    EXPECT_FALSE(sd.sacl.has_value());
    EXPECT_FALSE(sd.dacl.has_value());
}

// ============================================================================
// TST-SD-003: Decode_Full
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_003_Decode_Full) {
    auto data = full_sd();
    ASSERT_EQ(data.size(), 100u);

    std::vector<Anomaly> anomalies;
    auto result = decode_security_descriptor(data, DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(result));
    EXPECT_TRUE(anomalies.empty());

    const auto& sd = value(result);
    EXPECT_EQ(sd.revision, SD_REVISION);
    EXPECT_EQ(sd.control, 0x8004);
    EXPECT_EQ(sd.owner->to_string(), "S-1-5-18");
    EXPECT_EQ(sd.group->to_string(), "S-1-5-32-544");
    EXPECT_FALSE(sd.sacl.has_value());
    ASSERT_TRUE(sd.dacl.has_value());
    ASSERT_EQ(sd.dacl->entries.size(), 2u);
    EXPECT_EQ(sd.dacl->entries[1].sid()->to_string(), "S-1-5-32-545");
    EXPECT_EQ(sd.encoded_size(), 100u);
}

// ============================================================================
// TST-SD-004: Encode_RoundTrip
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_004_Encode_RoundTrip) {
    for (const auto& data : {full_sd(), owner_only_sd()}) {
        auto result = decode_security_descriptor(data);
        ASSERT_TRUE(succeeded(result));
        EXPECT_EQ(encode_security_descriptor(value(result)), data);
    }
}

// ============================================================================
// TST-SD-005: Offset_OutOfBounds
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_005_Offset_OutOfBounds) {
    auto data = full_sd();
    put_u32(data, 8, 100);  // group offset == buffer size

    auto result = decode_security_descriptor(data);
    ASSERT_FALSE(succeeded(result));
    EXPECT_EQ(error(result).kind, DecodeErrorKind::OutOfBounds);

    put_u32(data, 8, 0xFFFFFFF0u);
    auto huge = decode_security_descriptor(data);
    ASSERT_FALSE(succeeded(huge));
    EXPECT_EQ(error(huge).kind, DecodeErrorKind::OutOfBounds);
}

// ============================================================================
// TST-SD-006: Truncated_Buffer
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_006_Truncated_Buffer) {
    auto data = full_sd();
    for (std::size_t len = 0; len < data.size(); ++len) {
        auto result = decode_security_descriptor(data.data(), len);
        ASSERT_FALSE(succeeded(result)) << "length " << len;
        EXPECT_EQ(error(result).kind, DecodeErrorKind::OutOfBounds) << "length " << len;
    }
}

// ============================================================================
// TST-SD-007: DaclPresent_Without_Offset
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_007_DaclPresent_Without_Offset) {
    auto data = owner_only_sd();
    data[2] = 0x04;  // SE_DACL_PRESENT, DACL offset 0

    std::vector<Anomaly> anomalies;
    auto result = decode_security_descriptor(data, DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(result));
    EXPECT_FALSE(value(result).dacl.has_value());
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].kind, DecodeErrorKind::OffsetControlMismatch);
    EXPECT_EQ(anomalies[0].offset, 2u);

    DecodeOptions strict;
    strict.strict = true;
    auto strict_result = decode_security_descriptor(data, strict);
    ASSERT_FALSE(succeeded(strict_result));
    EXPECT_EQ(error(strict_result).kind, DecodeErrorKind::OffsetControlMismatch);
}

// ============================================================================
// TST-SD-008: Offset_Without_Flag
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_008_Offset_Without_Flag) {
    auto data = full_sd();
    data[2] = 0x00;  // SE_DACL_PRESENT cleared, DACL offset 48

    std::vector<Anomaly> anomalies;
    auto result = decode_security_descriptor(data, DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(result));
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].kind, DecodeErrorKind::OffsetControlMismatch);

    // DACL всё равно декодирован, при кодировании флаг выставляется
    const auto& sd = value(result);
    ASSERT_TRUE(sd.dacl.has_value());
    EXPECT_EQ(sd.control, 0x8000);
    EXPECT_EQ(sd.effective_control(), 0x8004);
    EXPECT_EQ(encode_security_descriptor(sd), full_sd());
}

// ============================================================================
// TST-SD-009: Revision_Handling
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_009_Revision_Handling) {
    auto data = owner_only_sd();
    data[0] = 2;

    std::vector<Anomaly> anomalies;
    auto result = decode_security_descriptor(data, DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(result));
    EXPECT_EQ(value(result).revision, 2);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].kind, DecodeErrorKind::InvalidRevision);

    DecodeOptions enforce;
    enforce.enforce_revision = true;
    auto enforced = decode_security_descriptor(data, enforce);
    ASSERT_FALSE(succeeded(enforced));
    EXPECT_EQ(error(enforced).kind, DecodeErrorKind::InvalidRevision);
}

// ============================================================================
// TST-SD-010: Decode_Inside_Larger_Buffer
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_010_Decode_Inside_Larger_Buffer) {
    std::vector<std::uint8_t> data(5, 0xEE);
    auto sd_bytes = full_sd();
    data.insert(data.end(), sd_bytes.begin(), sd_bytes.end());
    data.insert(data.end(), {0xEE, 0xEE, 0xEE});

    io::ByteCursor cursor(data);
    ASSERT_TRUE(cursor.skip(5));
    DecodeContext context;

    auto result = read_security_descriptor(cursor, context);
    ASSERT_TRUE(succeeded(result));
    EXPECT_EQ(value(result).group->to_string(), "S-1-5-32-544");
    EXPECT_EQ(cursor.position(), 105u);

    // Ошибки содержат абсолютное смещение в исходном буфере
    data[5 + 48 + 2 + 8] = 0x10;  // первый ACE DACL: size 16
    io::ByteCursor broken(data);
    ASSERT_TRUE(broken.skip(5));
    auto failed = read_security_descriptor(broken, context);
    ASSERT_FALSE(succeeded(failed));
    EXPECT_EQ(error(failed).kind, DecodeErrorKind::AceBodyOverrun);
    EXPECT_EQ(error(failed).offset, 5u + 48 + 8 + 16);
}

// ============================================================================
// TST-SD-011: Encode_Built_Descriptor
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_011_Encode_Built_Descriptor) {
    SecurityDescriptor sd;
    sd.control |= static_cast<std::uint16_t>(SdControlFlags::DaclProtected);
    sd.owner = Sid::parse("S-1-5-32-544");
    sd.sacl = Acl{};
    sd.dacl = Acl{};

    auto bytes = encode_security_descriptor(sd);
    ASSERT_EQ(bytes.size(), 20u + 16 + 8 + 8);
    EXPECT_EQ(bytes.size(), sd.encoded_size());

    auto result = decode_security_descriptor_header(bytes);
    ASSERT_TRUE(std::holds_alternative<SecurityDescriptorHeader>(result));
    const auto& header = std::get<SecurityDescriptorHeader>(result);
    EXPECT_EQ(header.control, 0x9014);
    EXPECT_EQ(header.owner_offset, 20u);
    EXPECT_EQ(header.group_offset, 0u);
    EXPECT_EQ(header.sacl_offset, 36u);
    EXPECT_EQ(header.dacl_offset, 44u);

    std::vector<Anomaly> anomalies;
    auto decoded = decode_security_descriptor(bytes, DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(decoded));
    EXPECT_TRUE(anomalies.empty());
    EXPECT_EQ(value(decoded).owner, sd.owner);
    EXPECT_EQ(value(decoded).sacl, sd.sacl);
    EXPECT_EQ(value(decoded).control, 0x9014);
    EXPECT_EQ(value(decoded), sd);
}

// ============================================================================
// TST-SD-012: Control_Flag_Names
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_012_Control_Flag_Names) {
    EXPECT_EQ(sd_control_flags_to_string(0), "NONE");
    EXPECT_EQ(sd_control_flags_to_string(0x8004), "SE_DACL_PRESENT | SE_SELF_RELATIVE");
    EXPECT_EQ(sd_control_flags_to_string(0x9804),
              "SE_DACL_PRESENT | SE_SACL_AUTO_INHERITED | SE_DACL_PROTECTED | SE_SELF_RELATIVE");
    EXPECT_EQ(sd_control_flags_to_string(0x00C0), "0x00C0");
}

// ============================================================================
// TST-SD-013: Diagnostics_Logged
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_013_Diagnostics_Logged) {
    std::FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);

    output::OutputConfig config;
    config.verbose = 2;
    config.sink = sink;

    std::string text;
    {
        output::Writer writer(config);
        DecodeOptions options;
        options.log = &writer;

        auto data = full_sd();
        data[2] = 0x00;
        auto result = decode_security_descriptor(data, options);
        ASSERT_TRUE(succeeded(result));
        writer.flush();

        std::rewind(sink);
        char buf[512];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), sink)) > 0) {
            text.append(buf, n);
        }
    }
    std::fclose(sink);

    EXPECT_NE(text.find("[*] security descriptor at offset 0"), std::string::npos);
    EXPECT_NE(text.find("[!] OffsetControlMismatch at offset 2"), std::string::npos);
    EXPECT_NE(text.find("[~] SID S-1-5-18 at offset 20"), std::string::npos);
    EXPECT_NE(text.find("[~] ACE ACCESS_DENIED size 24"), std::string::npos);
}

// ============================================================================
// TST-SD-014: Built_Defaults_RoundTrip
// ============================================================================

TEST_F(SecurityDescriptorTest, TST_SD_014_Built_Defaults_RoundTrip) {
    // control по умолчанию (SE_SELF_RELATIVE), SE_DACL_PRESENT не выставлен
    SecurityDescriptor sd;
    sd.owner = Sid::parse("S-1-5-18");
    sd.dacl = Acl{};

    AceObject object;
    object.access_mask = 0x100;
    object.object_type = Guid::parse("54849625-5478-4994-A5BA-3E3B0328C30D");
    object.sid = *Sid::parse("S-1-5-10");
    Ace ace;
    ace.type = AceType::AccessAllowedObject;
    ace.body = object;
    sd.dacl->entries.push_back(ace);

    std::vector<Anomaly> anomalies;
    auto decoded =
        decode_security_descriptor(encode_security_descriptor(sd), DecodeOptions{}, &anomalies);
    ASSERT_TRUE(succeeded(decoded));
    EXPECT_TRUE(anomalies.empty());
    EXPECT_EQ(value(decoded).control, 0x8004);
    EXPECT_EQ(value(decoded), sd);

    // Биты присутствия не различают дескрипторы, остальные биты различают
    SecurityDescriptor protected_sd = sd;
    protected_sd.control |= static_cast<std::uint16_t>(SdControlFlags::DaclProtected);
    EXPECT_NE(protected_sd, sd);
}

}  // namespace winstructs::security
