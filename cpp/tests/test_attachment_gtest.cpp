// ==============================================================================
// test_attachment_gtest.cpp - Тесты индекса привязок (GoogleTest)
// ==============================================================================

#include "sgaudit/attachment.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace sgaudit::audit::test {

namespace {

io::NetworkInterface eni(const std::string& id, const std::string& ip,
                         std::vector<std::string> groups) {
    io::NetworkInterface out;
    out.interface_id = id;
    out.description = "eni " + id;
    out.private_ip = ip;
    for (auto& g : groups) {
        out.groups.push_back(io::GroupRef{std::move(g)});
    }
    return out;
}

}  // namespace

TEST(AttachmentIndexTest, Build_Empty) {
    auto index = AttachmentIndex::build({});

    EXPECT_EQ(index.group_count(), 0u);
    EXPECT_TRUE(index.attachments("sg-1").empty());
    EXPECT_EQ(index.count("sg-1"), 0u);
}

TEST(AttachmentIndexTest, Build_GroupsByIdInDocumentOrder) {
    // Arrange
    std::vector<io::NetworkInterface> enis = {
        eni("eni-1", "10.0.0.1", {"sg-a", "sg-b"}),
        eni("eni-2", "10.0.0.2", {"sg-a"}),
    };

    // Act
    auto index = AttachmentIndex::build(enis);

    // Assert
    EXPECT_EQ(index.group_count(), 2u);
    ASSERT_EQ(index.count("sg-a"), 2u);
    EXPECT_EQ(index.attachments("sg-a")[0], (Attachment{"eni-1", "eni eni-1", "10.0.0.1"}));
    EXPECT_EQ(index.attachments("sg-a")[1], (Attachment{"eni-2", "eni eni-2", "10.0.0.2"}));
    EXPECT_EQ(index.count("sg-b"), 1u);
}

TEST(AttachmentIndexTest, Build_SkipsEmptyGroupId) {
    std::vector<io::NetworkInterface> enis = {eni("eni-1", "10.0.0.1", {"", "sg-a"})};

    auto index = AttachmentIndex::build(enis);

    EXPECT_EQ(index.group_count(), 1u);
    EXPECT_EQ(index.count(""), 0u);
    EXPECT_EQ(index.count("sg-a"), 1u);
}

TEST(AttachmentIndexTest, Build_InterfaceWithoutGroups) {
    std::vector<io::NetworkInterface> enis = {eni("eni-1", "10.0.0.1", {})};

    auto index = AttachmentIndex::build(enis);

    EXPECT_EQ(index.group_count(), 0u);
}

TEST(AttachmentIndexTest, Build_KeepsDefaultsFromLoader) {
    io::NetworkInterface bare;
    bare.groups.push_back(io::GroupRef{"sg-a"});

    auto index = AttachmentIndex::build({bare});

    ASSERT_EQ(index.count("sg-a"), 1u);
    EXPECT_EQ(index.attachments("sg-a")[0].interface_id, "unknown");
    EXPECT_EQ(index.attachments("sg-a")[0].private_ip, io::NOT_AVAILABLE);
}

}  // namespace sgaudit::audit::test
