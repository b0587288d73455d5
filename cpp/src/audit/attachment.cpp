// ==============================================================================
// attachment.cpp - Индекс привязок security group -> интерфейсы
// ==============================================================================

#include "sgaudit/attachment.hpp"

namespace sgaudit::audit {

AttachmentIndex AttachmentIndex::build(const std::vector<io::NetworkInterface>& interfaces) {
    AttachmentIndex index;
    for (const auto& eni : interfaces) {
        for (const auto& ref : eni.groups) {
            // Ссылки без GroupId отброшены ещё при загрузке; пустые строки
            // могут прийти только из программно собранного инвентаря
            if (ref.group_id.empty()) {
                continue;
            }
            index.by_group_[ref.group_id].push_back(
                Attachment{eni.interface_id, eni.description, eni.private_ip});
        }
    }
    return index;
}

const std::vector<Attachment>& AttachmentIndex::attachments(const std::string& group_id) const {
    static const std::vector<Attachment> EMPTY;
    auto it = by_group_.find(group_id);
    return it != by_group_.end() ? it->second : EMPTY;
}

}  // namespace sgaudit::audit
