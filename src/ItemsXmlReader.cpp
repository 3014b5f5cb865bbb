/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ItemsXmlReader.hpp"
#include "common/string_utils.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <unordered_set>

namespace otitems {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc *doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool is_element(const xmlNode *node, const char *name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, reinterpret_cast<const xmlChar *>(name)) == 0;
}

std::optional<std::string> read_xml_string(const xmlNode *node, const char *name) {
    auto *value = xmlGetProp(node, reinterpret_cast<const xmlChar *>(name));
    if (!value)
        return std::nullopt;
    std::string result(reinterpret_cast<const char *>(value));
    xmlFree(value);
    return result;
}

// Reads a leading decimal integer, ignoring leading whitespace and anything after the digits: "12abc" is 12.
std::optional<long> parse_leading_int(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
        str.remove_prefix(1);
    if (!str.empty() && str.front() == '+')
        str.remove_prefix(1);
    long result{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc())
        return std::nullopt;
    return result;
}

bool has_attribute_children(const xmlNode *node) {
    for (auto *child = node->children; child; child = child->next) {
        if (is_element(child, "attribute"))
            return true;
    }
    return false;
}

class ItemElementParser {
public:
    explicit ItemElementParser(const ItemsXmlReadOptions &options) {
        for (const auto &key : options.known_attributes)
            known_attributes_.insert(lower_case(key));
        const auto &tags =
            options.known_tag_attributes.empty() ? DefaultKnownTagAttributes : options.known_tag_attributes;
        known_tag_attributes_.insert(tags.begin(), tags.end());
    }

    void parse(const xmlNode *element, ServerItem &item) {
        for (auto *attr = element->properties; attr; attr = attr->next) {
            std::string name(reinterpret_cast<const char *>(attr->name));
            if (name == "id" || name == "fromid" || name == "toid")
                continue;
            if (!known_tag_attributes_.count(name))
                missing_tag_attributes_.insert(name);
            item.set_xml_attribute(name, read_xml_string(element, name.c_str()).value_or(""));
        }
        for (auto *child = element->children; child; child = child->next) {
            if (is_element(child, "attribute"))
                parse_attribute(child, item);
        }
    }

    [[nodiscard]] ItemsXmlReadResult result() const {
        ItemsXmlReadResult result{true, {}, {}};
        for (const auto &[lower, key] : missing_attributes_)
            result.missing_attributes.push_back(key);
        std::sort(result.missing_attributes.begin(), result.missing_attributes.end());
        result.missing_tag_attributes.assign(missing_tag_attributes_.begin(), missing_tag_attributes_.end());
        return result;
    }

private:
    void parse_attribute(const xmlNode *node, ServerItem &item) {
        auto key = read_xml_string(node, "key");
        if (!key || key->empty())
            return;
        if (has_attribute_children(node)) {
            XmlAttributeRecord record;
            if (auto parent_value = read_xml_string(node, "value"); parent_value && !parent_value->empty())
                record.emplace(ParentValueKey, *parent_value);
            for (auto *child = node->children; child; child = child->next) {
                if (!is_element(child, "attribute"))
                    continue;
                if (auto child_key = read_xml_string(child, "key"); child_key && !child_key->empty())
                    record[*child_key] = read_xml_string(child, "value").value_or("");
            }
            item.set_xml_attribute(*key, std::move(record));
        } else {
            item.set_xml_attribute(*key, read_xml_string(node, "value").value_or(""));
        }
        if (!known_attributes_.empty()) {
            auto lower = lower_case(*key);
            if (!known_attributes_.count(lower))
                missing_attributes_.emplace(lower, *key);
        }
    }

    std::unordered_set<std::string> known_attributes_;
    std::unordered_set<std::string> known_tag_attributes_;
    // Lower-cased key to the first spelling seen.
    std::map<std::string, std::string> missing_attributes_;
    std::set<std::string> missing_tag_attributes_;
};

}

ItemsXmlReadResult read_items_xml(std::string_view xml, ServerItemList &items, const ItemsXmlReadOptions &options) {
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc)
        return {};
    auto *root = xmlDocGetRootElement(doc.get());
    if (!root)
        return {};

    ItemElementParser parser(options);
    for (auto *node = root->children; node; node = node->next) {
        if (!is_element(node, "item"))
            continue;
        auto id = read_xml_string(node, "id");
        if (id && !id->empty()) {
            if (auto parsed = parse_leading_int(*id); parsed && *parsed >= 0 && *parsed <= 0xffff) {
                if (auto *item = items.get_by_id(static_cast<uint16_t>(*parsed)))
                    parser.parse(node, *item);
            }
            continue;
        }
        auto from_id = read_xml_string(node, "fromid");
        auto to_id = read_xml_string(node, "toid");
        if (!from_id || from_id->empty() || !to_id || to_id->empty())
            continue;
        auto from = parse_leading_int(*from_id);
        auto to = parse_leading_int(*to_id);
        if (!from || !to)
            continue;
        for (auto range_id = std::max(*from, 0L); range_id <= std::min(*to, 0xffffL); ++range_id) {
            if (auto *item = items.get_by_id(static_cast<uint16_t>(range_id)))
                parser.parse(node, *item);
        }
    }
    return parser.result();
}

}
