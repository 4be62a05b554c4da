#include <gtest/gtest.h>
#include <folio/storage/collection_page.hpp>
#include <folio/util/crc32.hpp>

#include "test_document.hpp"

using namespace folio;

namespace {

constexpr uint64_t BUDGET = 40;  // two empty-named documents per page

using Page = CollectionPage<TestDocument>;

}  // namespace

// ============================================================================
// Space accounting
// ============================================================================

TEST(CollectionPageTest, NewPageIsEmpty) {
    Page page(3, BUDGET);

    EXPECT_EQ(page.get_page_number(), 3u);
    EXPECT_EQ(page.header().number_of_documents, 0u);
    EXPECT_EQ(page.header().free_space_available, BUDGET);
    EXPECT_TRUE(page.documents().empty());
}

TEST(CollectionPageTest, InsertOneDocument) {
    Page page(0, BUDGET);

    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());

    ASSERT_EQ(page.documents().size(), 1u);
    EXPECT_EQ(page.documents()[0], make_doc(1));
    EXPECT_EQ(page.header().number_of_documents, 1u);
    EXPECT_EQ(page.header().free_space_available, BUDGET - EMPTY_TEST_DOCUMENT_SIZE);
}

TEST(CollectionPageTest, InsertKeepsInsertionOrder) {
    Page page(0, 1000);

    ASSERT_TRUE(page.insert_document(make_doc(7, "seven")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(2, "two")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(5)).ok());

    ASSERT_EQ(page.documents().size(), 3u);
    EXPECT_EQ(page.documents()[0].id, 7u);
    EXPECT_EQ(page.documents()[1].id, 2u);
    EXPECT_EQ(page.documents()[2].id, 5u);
    EXPECT_EQ(page.header().free_space_available,
              1000 - (3 * EMPTY_TEST_DOCUMENT_SIZE + 5 + 3));
}

TEST(CollectionPageTest, InsertWithoutSpaceFails) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());
    ASSERT_TRUE(page.insert_document(make_doc(2)).ok());

    auto result = page.insert_document(make_doc(3));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::NO_FREE_SPACE);

    EXPECT_EQ(page.documents().size(), 2u);
    EXPECT_EQ(page.header().number_of_documents, 2u);
    EXPECT_EQ(page.header().free_space_available, BUDGET - 2 * EMPTY_TEST_DOCUMENT_SIZE);
}

TEST(CollectionPageTest, InsertExactFit) {
    Page page(0, EMPTY_TEST_DOCUMENT_SIZE + 4);

    ASSERT_TRUE(page.insert_document(make_doc(1, "abcd")).ok());
    EXPECT_EQ(page.header().free_space_available, 0u);
}

// ============================================================================
// Find
// ============================================================================

TEST(CollectionPageTest, FindDocument) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1, "a")).ok());

    auto doc = page.find_document(1);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(*doc, make_doc(1, "a"));
}

TEST(CollectionPageTest, DoNotFindDocument) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());

    EXPECT_FALSE(page.find_document(2).has_value());
}

// ============================================================================
// Update
// ============================================================================

TEST(CollectionPageTest, UpdateSameSize) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1, "lol")).ok());
    uint64_t free_before = page.header().free_space_available;

    ASSERT_TRUE(page.update_document(make_doc(1, "mdr")).ok());

    ASSERT_EQ(page.documents().size(), 1u);
    EXPECT_EQ(page.documents()[0], make_doc(1, "mdr"));
    EXPECT_EQ(page.header().free_space_available, free_before);
    EXPECT_EQ(page.header().number_of_documents, 1u);
}

TEST(CollectionPageTest, UpdateShrinkReturnsSpace) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1, "abcdef")).ok());
    EXPECT_EQ(page.header().free_space_available, BUDGET - EMPTY_TEST_DOCUMENT_SIZE - 6);

    ASSERT_TRUE(page.update_document(make_doc(1, "ab")).ok());
    EXPECT_EQ(page.header().free_space_available, BUDGET - EMPTY_TEST_DOCUMENT_SIZE - 2);
}

TEST(CollectionPageTest, UpdateGrowthWithinFreeSpace) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());

    ASSERT_TRUE(page.update_document(make_doc(1, "0123456789")).ok());
    EXPECT_EQ(page.header().free_space_available, BUDGET - EMPTY_TEST_DOCUMENT_SIZE - 10);
}

TEST(CollectionPageTest, UpdateGrowthBeyondFreeSpaceFails) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());
    ASSERT_TRUE(page.insert_document(make_doc(2)).ok());

    // 8 bytes free, growth of 9
    auto result = page.update_document(make_doc(1, "123456789"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::NO_FREE_SPACE);

    EXPECT_EQ(page.documents()[0], make_doc(1));
    EXPECT_EQ(page.header().free_space_available, BUDGET - 2 * EMPTY_TEST_DOCUMENT_SIZE);
}

TEST(CollectionPageTest, UpdateMissingDocument) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());

    auto result = page.update_document(make_doc(2));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::DOCUMENT_NOT_FOUND);
}

// ============================================================================
// Remove
// ============================================================================

TEST(CollectionPageTest, RemoveRestoresAccounting) {
    Page page(0, 1000);
    ASSERT_TRUE(page.insert_document(make_doc(1, "a")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(2, "bb")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(3, "ccc")).ok());

    auto removed = page.remove_document(1);
    ASSERT_TRUE(removed.ok()) << removed.error().to_string();
    EXPECT_EQ(removed.value(), make_doc(1, "a"));

    // Last document takes the removed slot
    ASSERT_EQ(page.documents().size(), 2u);
    EXPECT_EQ(page.documents()[0].id, 3u);
    EXPECT_EQ(page.documents()[1].id, 2u);

    EXPECT_EQ(page.header().number_of_documents, 2u);
    EXPECT_EQ(page.header().free_space_available,
              1000 - (2 * EMPTY_TEST_DOCUMENT_SIZE + 2 + 3));
}

TEST(CollectionPageTest, RemoveLastDocument) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());

    ASSERT_TRUE(page.remove_document(1).ok());
    EXPECT_TRUE(page.documents().empty());
    EXPECT_EQ(page.header().number_of_documents, 0u);
    EXPECT_EQ(page.header().free_space_available, BUDGET);
}

TEST(CollectionPageTest, RemoveMissingDocument) {
    Page page(0, BUDGET);

    auto result = page.remove_document(4);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::DOCUMENT_NOT_FOUND);
}

// ============================================================================
// Encoding
// ============================================================================

TEST(CollectionPageTest, EncodeDecodeRoundTrip) {
    Page page(5, 1000);
    ASSERT_TRUE(page.insert_document(make_doc(10, "ten")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(11, "")).ok());
    ASSERT_TRUE(page.insert_document(make_doc(12, std::string(100, 'x'))).ok());

    std::string payload = page.encode();
    EXPECT_EQ(payload.size(), PAGE_HEADER_SIZE + page.used_space());

    auto decoded = Page::decode(payload, 1000);
    ASSERT_TRUE(decoded.ok()) << decoded.error().to_string();
    EXPECT_TRUE(decoded.value() == page);
}

TEST(CollectionPageTest, DecodeEmptyPage) {
    Page page(0, BUDGET);

    auto decoded = Page::decode(page.encode(), BUDGET);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.value() == page);
}

TEST(CollectionPageTest, DecodeRejectsTruncatedPayload) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1, "abc")).ok());
    std::string payload = page.encode();
    payload.resize(payload.size() - 2);

    auto decoded = Page::decode(payload, BUDGET);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::CORRUPTION);
}

TEST(CollectionPageTest, DecodeRejectsTrailingBytes) {
    Page page(0, BUDGET);
    std::string payload = page.encode() + "junk";

    auto decoded = Page::decode(payload, BUDGET);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::CORRUPTION);
}

TEST(CollectionPageTest, DecodeRejectsInconsistentFreeSpace) {
    Page page(0, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(1)).ok());
    std::string payload = page.encode();
    payload[16] = static_cast<char>(payload[16] + 1);  // free_space_available low byte

    auto decoded = Page::decode(payload, BUDGET);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::CORRUPTION);
}

TEST(CollectionPageTest, DecodeRejectsImplausibleDocumentCount) {
    BinaryWriter writer;
    CollectionPageHeader header;
    header.page_number = 0;
    header.number_of_documents = 1000000;
    header.free_space_available = BUDGET;
    encode_page_header(header, writer);

    auto decoded = Page::decode(writer.data(), BUDGET);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::CORRUPTION);
}

// ============================================================================
// Page frames and geometry
// ============================================================================

TEST(PageFrameTest, FrameIsPaddedToPageSize) {
    auto framed = frame_page_payload("payload", 128);
    ASSERT_TRUE(framed.ok());
    EXPECT_EQ(framed.value().size(), 128u);

    auto payload = unframe_page_payload(framed.value().data(), framed.value().size());
    ASSERT_TRUE(payload.ok()) << payload.error().to_string();
    EXPECT_EQ(payload.value(), "payload");
}

TEST(PageFrameTest, FrameRejectsOversizedPayload) {
    auto framed = frame_page_payload(std::string(121, 'a'), 128);
    ASSERT_FALSE(framed.ok());
    EXPECT_EQ(framed.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(PageFrameTest, ChecksumMismatchDetected) {
    auto framed = frame_page_payload("payload", 64);
    ASSERT_TRUE(framed.ok());
    std::string bytes = framed.value();
    bytes[PAGE_FRAME_SIZE] = 'P';

    auto payload = unframe_page_payload(bytes.data(), bytes.size());
    ASSERT_FALSE(payload.ok());
    EXPECT_EQ(payload.error_code(), ErrorCode::CORRUPTION);
}

TEST(PageFrameTest, ZeroedExtentIsNotAPage) {
    std::string zeros(64, '\0');

    auto header = decode_page_header_prefix(zeros.data(), page_overhead(), 64);
    ASSERT_FALSE(header.ok());
    EXPECT_EQ(header.error_code(), ErrorCode::CORRUPTION);
}

TEST(PageFrameTest, HeaderPrefixMatchesPage) {
    Page page(2, BUDGET);
    ASSERT_TRUE(page.insert_document(make_doc(9, "x")).ok());
    auto framed = frame_page_payload(page.encode(), 128);
    ASSERT_TRUE(framed.ok());

    auto header = decode_page_header_prefix(framed.value().data(), page_overhead(), 128);
    ASSERT_TRUE(header.ok()) << header.error().to_string();
    EXPECT_EQ(header.value(), page.header());
}

TEST(StorageOptionsTest, DefaultsAreValid) {
    EXPECT_TRUE(validate_storage_options(StorageOptions{}).ok());
}

TEST(StorageOptionsTest, BudgetMustLeaveRoomForOverhead) {
    StorageOptions options;
    options.page_size = 100;
    options.page_data_budget = 100 - page_overhead();
    EXPECT_TRUE(validate_storage_options(options).ok());

    options.page_data_budget += 1;
    auto result = validate_storage_options(options);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(StorageOptionsTest, ZeroBudgetRejected) {
    StorageOptions options;
    options.page_data_budget = 0;
    EXPECT_EQ(validate_storage_options(options).error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(CRC32Test, KnownVector) {
    EXPECT_EQ(CRC32::compute(std::string("123456789")), 0xCBF43926u);
}

TEST(CRC32Test, UpdateContinuesChecksum) {
    std::string a = "hello ";
    std::string b = "world";
    uint32_t running = CRC32::compute(a);
    running = CRC32::update(running, reinterpret_cast<const uint8_t*>(b.data()), b.size());
    EXPECT_EQ(running, CRC32::compute(a + b));
}
