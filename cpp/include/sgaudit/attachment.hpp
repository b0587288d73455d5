// ==============================================================================
// sgaudit/attachment.hpp - Индекс привязок security group -> интерфейсы
// ==============================================================================
//
// Строится по network_interfaces одного региона. Группа, отсутствующая в
// индексе, считается неиспользуемой (ноль привязок).
//
// ==============================================================================

#ifndef SGAUDIT_ATTACHMENT_HPP
#define SGAUDIT_ATTACHMENT_HPP

#include <sgaudit/inventory.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace sgaudit::audit {

/// Сетевой интерфейс, привязанный к группе
struct Attachment {
    std::string interface_id;
    std::string description;
    std::string private_ip;

    bool operator==(const Attachment& other) const {
        return interface_id == other.interface_id && description == other.description &&
               private_ip == other.private_ip;
    }
};

class AttachmentIndex {
public:
    AttachmentIndex() = default;

    /// Построить индекс по интерфейсам региона.
    /// Порядок привязок внутри группы = порядок интерфейсов в документе.
    static AttachmentIndex build(const std::vector<io::NetworkInterface>& interfaces);

    /// Привязки группы (пустой список, если группа не встречалась)
    const std::vector<Attachment>& attachments(const std::string& group_id) const;

    std::size_t count(const std::string& group_id) const {
        return attachments(group_id).size();
    }

    /// Число групп, у которых есть хотя бы одна привязка
    std::size_t group_count() const { return by_group_.size(); }

private:
    std::unordered_map<std::string, std::vector<Attachment>> by_group_;
};

}  // namespace sgaudit::audit

#endif  // SGAUDIT_ATTACHMENT_HPP
