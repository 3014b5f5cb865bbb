#include "ItemsXmlWriter.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>
#include <libxml/encoding.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <variant>

namespace otitems {

namespace {

constexpr auto Unprioritised = std::numeric_limits<int>::max();

class ItemsXmlWriter {
public:
    explicit ItemsXmlWriter(const ItemsXmlWriteOptions &options)
        : options_(options), tag_keys_(options.tag_attribute_keys.begin(), options.tag_attribute_keys.end()) {}

    std::string write(const ServerItemList &items) {
        out_ = fmt::format("<?xml version=\"1.0\" encoding=\"{}\"?>\n<items>\n", options_.encoding);
        auto sorted = items.to_array();
        for (size_t i = 0; i < sorted.size();) {
            if (!sorted[i]->has_xml_data()) {
                ++i;
                continue;
            }
            auto end = options_.supports_from_to_id ? range_end(sorted, i) : i;
            write_item(*sorted[i], *sorted[end]);
            i = end + 1;
        }
        out_ += "</items>\n";
        return std::move(out_);
    }

private:
    // Index of the last item of the run starting at start: consecutive ids with identical attributes.
    static size_t range_end(const std::vector<const ServerItem *> &items, size_t start) {
        auto end = start;
        for (auto i = start + 1; i < items.size(); ++i) {
            if (items[i]->id != items[i - 1]->id + 1 || items[i]->xml_attributes != items[start]->xml_attributes)
                break;
            end = i;
        }
        return end;
    }

    [[nodiscard]] bool is_nested(std::string_view key) const {
        return key != ParentValueKey && !tag_keys_.count(std::string(key));
    }

    void write_item(const ServerItem &item, const ServerItem &end) {
        if (end.id != item.id)
            out_ += fmt::format("\t<item fromid=\"{}\" toid=\"{}\"", item.id, end.id);
        else
            out_ += fmt::format("\t<item id=\"{}\"", item.id);

        for (const auto &key : options_.tag_attribute_keys) {
            auto value = item.xml_attribute_string(key);
            if (value && (!value->empty() || key == "name"))
                out_ += fmt::format(" {}=\"{}\"", xml_escape(key), xml_escape(*value));
        }

        auto nested = nested_keys(item.xml_attributes);
        if (nested.empty()) {
            out_ += " />\n";
            return;
        }
        out_ += ">\n";
        for (const auto *key : nested)
            write_attribute(*key, item.xml_attributes.at(*key));
        out_ += "\t</item>\n";
    }

    [[nodiscard]] std::vector<const std::string *> nested_keys(const XmlAttributes &attributes) const {
        std::vector<const std::string *> keys;
        for (const auto &[key, value] : attributes) {
            if (is_nested(key))
                keys.push_back(&key);
        }
        auto priority = [this](const std::string &key) {
            auto it = options_.attribute_priority.find(key);
            return it == options_.attribute_priority.end() ? Unprioritised : it->second;
        };
        // The map is already alphabetical, so a stable sort on priority alone is enough.
        std::stable_sort(keys.begin(), keys.end(),
                         [&](const auto *lhs, const auto *rhs) { return priority(*lhs) < priority(*rhs); });
        return keys;
    }

    void write_attribute(const std::string &key, const XmlAttributeValue &value) {
        if (const auto *str = std::get_if<std::string>(&value)) {
            out_ += fmt::format("\t\t<attribute key=\"{}\" value=\"{}\" />\n", xml_escape(key), xml_escape(*str));
            return;
        }
        const auto &record = std::get<XmlAttributeRecord>(value);
        out_ += fmt::format("\t\t<attribute key=\"{}\"", xml_escape(key));
        if (auto it = record.find(std::string(ParentValueKey)); it != record.end() && !it->second.empty())
            out_ += fmt::format(" value=\"{}\"", xml_escape(it->second));
        out_ += ">\n";
        for (const auto &[child_key, child_value] : record) {
            if (child_key == ParentValueKey)
                continue;
            out_ += fmt::format("\t\t\t<attribute key=\"{}\" value=\"{}\" />\n", xml_escape(child_key),
                                xml_escape(child_value));
        }
        out_ += "\t\t</attribute>\n";
    }

    const ItemsXmlWriteOptions &options_;
    std::unordered_set<std::string> tag_keys_;
    std::string out_;
};

}

ItemsXmlWriteOptions ItemsXmlWriteOptions::for_schema(const AttributeSchema &schema) {
    ItemsXmlWriteOptions options;
    options.encoding = schema.items_xml_encoding();
    options.supports_from_to_id = schema.supports_from_to_id();
    if (auto tag_keys = schema.tag_attribute_keys(); !tag_keys.empty())
        options.tag_attribute_keys = std::move(tag_keys);
    options.attribute_priority = schema.attribute_priority();
    return options;
}

std::string write_items_xml(const ServerItemList &items, const ItemsXmlWriteOptions &options) {
    return ItemsXmlWriter(options).write(items);
}

std::string encode_items_xml(const std::string &xml, std::string_view encoding) {
    if (matches(encoding, "utf-8"))
        return xml;
    if (!matches(encoding, "iso-8859-1"))
        throw std::runtime_error(fmt::format("Unsupported items.xml encoding '{}'", encoding));
    if (xml.empty())
        return xml;

    // Latin-1 never needs more bytes than UTF-8.
    std::string result(xml.size(), '\0');
    int out_len = static_cast<int>(result.size());
    int in_len = static_cast<int>(xml.size());
    auto written = UTF8Toisolat1(reinterpret_cast<unsigned char *>(result.data()), &out_len,
                                 reinterpret_cast<const unsigned char *>(xml.data()), &in_len);
    if (written < 0 || in_len != static_cast<int>(xml.size()))
        throw std::runtime_error(
            fmt::format("items.xml text cannot be represented in {} near offset {}", encoding, in_len));
    result.resize(static_cast<size_t>(out_len));
    return result;
}

}
