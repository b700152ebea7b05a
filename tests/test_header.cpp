#include <numeric>
#include <string>
#include <vector>

#include <cohanon/header.hpp>

#include "recording_fixture.hpp"

using cohanon::HeaderField;

// The field table is contiguous and ends exactly at the header size
TEST(FieldTableTest, LayoutIsContiguous) {
  EXPECT_EQ(cohanon::fieldTable.front().offset, 314u);

  for (size_t i = 1; i < cohanon::fieldTable.size(); ++i) {
    const auto &previous = cohanon::fieldTable[i - 1];
    EXPECT_EQ(cohanon::fieldTable[i].offset, previous.offset + previous.width)
        << "Gap before field " << cohanon::fieldTable[i].name;
  }

  const auto &last = cohanon::fieldTable.back();
  EXPECT_EQ(last.offset + last.width, cohanon::HeaderLayout::headerSize);
}

TEST(FieldTableTest, Widths) {
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Name).width, 50u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Surname).width, 30u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Birthdate).width, 10u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Sex).width, 1u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Folder).width, 20u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Centre).width, 39u);
  EXPECT_EQ(cohanon::fieldSpec(HeaderField::Comment).width, 255u);
}

TEST(FieldTableTest, TableIsIndexedByField) {
  for (size_t i = 0; i < cohanon::fieldTable.size(); ++i) {
    EXPECT_EQ(static_cast<size_t>(cohanon::fieldTable[i].field), i);
  }
}

TEST(FieldTableTest, LookupByName) {
  for (const auto &spec : cohanon::fieldTable) {
    auto field = cohanon::fieldFromName(spec.name);
    ASSERT_TRUE(field.has_value()) << spec.name;
    EXPECT_EQ(*field, spec.field);
    EXPECT_EQ(cohanon::fieldName(spec.field), spec.name);
  }

  EXPECT_FALSE(cohanon::fieldFromName("patient").has_value());
  EXPECT_FALSE(cohanon::fieldFromName("Name").has_value());
}

TEST(ReadHeaderTest, ParsesFields) {
  auto bytes = makeRecording(samplePatient());

  cohanon::Error error;
  auto header = cohanon::readHeader(bytes, &error);
  ASSERT_TRUE(header.has_value()) << error.message;

  EXPECT_EQ(header->text(HeaderField::Name), "John");
  EXPECT_EQ(header->text(HeaderField::Surname), "Doe");
  EXPECT_EQ(header->text(HeaderField::Birthdate), "01/02/1960");
  EXPECT_EQ(header->text(HeaderField::Sex), "M");
  EXPECT_EQ(header->text(HeaderField::Folder), "F-2021-0042");
  EXPECT_EQ(header->text(HeaderField::Centre), "Hopital Saint-Luc");
  EXPECT_EQ(header->text(HeaderField::Comment), "Routine EEG, eyes closed");

  for (const auto &spec : cohanon::fieldTable) {
    EXPECT_EQ(header->raw(spec.field).size(), spec.width);
  }
}

TEST(ReadHeaderTest, ExactHeaderSizeIsEnough) {
  auto bytes = makeRecording(samplePatient(), 0);
  ASSERT_EQ(bytes.size(), cohanon::HeaderLayout::headerSize);
  EXPECT_TRUE(cohanon::readHeader(bytes).has_value());
}

TEST(ReadHeaderTest, ShortBufferIsMalformed) {
  std::vector<uint8_t> bytes(cohanon::HeaderLayout::headerSize - 1, 'x');

  cohanon::Error error;
  EXPECT_FALSE(cohanon::readHeader(bytes, &error).has_value());
  EXPECT_EQ(error.kind, cohanon::ErrorKind::MalformedHeader);
  EXPECT_FALSE(error.message.empty());

  EXPECT_FALSE(cohanon::readHeader({}, &error).has_value());
}

TEST(ReadHeaderTest, TextStopsAtNulAndTrimsSpaces) {
  auto bytes = makeRecording({});
  std::string padded = "Smith   ";
  ASSERT_TRUE(cohanon::writeField(bytes, HeaderField::Surname, padded));

  auto header = cohanon::readHeader(bytes);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->text(HeaderField::Surname), "Smith");
  EXPECT_EQ(header->text(HeaderField::Name), "");
}

TEST(EncodeFieldTest, PadsWithBlankByte) {
  std::string slot = cohanon::encodeField(HeaderField::Birthdate, "1960");
  ASSERT_EQ(slot.size(), 10u);
  EXPECT_EQ(slot.substr(0, 4), "1960");
  EXPECT_EQ(slot.substr(4), std::string(6, '\0'));
}

TEST(EncodeFieldTest, TruncatesToWidth) {
  EXPECT_EQ(cohanon::encodeField(HeaderField::Sex, "Female"), "F");

  std::string longComment(400, 'c');
  EXPECT_EQ(cohanon::encodeField(HeaderField::Comment, longComment), std::string(255, 'c'));
}

TEST(EncodeFieldTest, StopsAtFirstNonAsciiByte) {
  // "Müller" in UTF-8
  std::string slot = cohanon::encodeField(HeaderField::Surname, "M\xC3\xBCller");
  EXPECT_EQ(slot, std::string("M") + std::string(29, '\0'));
}

TEST(EncodeFieldTest, EmptyValueIsBlank) {
  for (const auto &spec : cohanon::fieldTable) {
    EXPECT_EQ(cohanon::encodeField(spec.field, ""), blankSlot(spec.field));
  }
}

// writeField then readHeader gives the value cut or padded to the slot width
TEST(WriteFieldTest, RoundTripWithinWidth) {
  const std::vector<std::string> values = {"", "A", "Jane", std::string(50, 'n'),
                                           std::string(300, 'z')};

  for (const auto &spec : cohanon::fieldTable) {
    for (const auto &value : values) {
      auto bytes = makeRecording(samplePatient());
      ASSERT_TRUE(cohanon::writeField(bytes, spec.field, value));

      auto header = cohanon::readHeader(bytes);
      ASSERT_TRUE(header.has_value());

      std::string expected = value.substr(0, spec.width);
      expected.resize(spec.width, '\0');
      EXPECT_EQ(header->raw(spec.field), expected) << spec.name << " <- \"" << value << "\"";
    }
  }
}

TEST(WriteFieldTest, TouchesOnlyItsSlot) {
  auto original = makeRecording(samplePatient());
  auto bytes = original;

  ASSERT_TRUE(cohanon::writeField(bytes, HeaderField::Centre, "Elsewhere"));
  ASSERT_EQ(bytes.size(), original.size());

  const auto &spec = cohanon::fieldSpec(HeaderField::Centre);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i < spec.offset || i >= spec.offset + spec.width) {
      ASSERT_EQ(bytes[i], original[i]) << "Byte " << i << " changed";
    }
  }
}

TEST(WriteFieldTest, ShortBufferIsMalformed) {
  std::vector<uint8_t> bytes(400, 0xAA);

  cohanon::Error error;
  EXPECT_FALSE(cohanon::writeField(bytes, HeaderField::Comment, "x", &error));
  EXPECT_EQ(error.kind, cohanon::ErrorKind::MalformedHeader);

  // Untouched on failure
  EXPECT_EQ(std::accumulate(bytes.begin(), bytes.end(), size_t{0}), size_t{400} * 0xAA);

  // The name slot (314..364) still fits
  EXPECT_TRUE(cohanon::writeField(bytes, HeaderField::Name, "x", &error));
}

TEST(ErrorKindTest, Names) {
  EXPECT_STREQ(cohanon::toString(cohanon::ErrorKind::SourceRead), "SourceReadError");
  EXPECT_STREQ(cohanon::toString(cohanon::ErrorKind::MalformedHeader), "MalformedHeader");
  EXPECT_STREQ(cohanon::toString(cohanon::ErrorKind::DestinationWrite), "DestinationWriteError");
  EXPECT_STREQ(cohanon::toString(cohanon::ErrorKind::ConversionFailed), "ConversionFailed");
}
