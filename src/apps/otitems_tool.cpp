#include "AttributeSchema.hpp"
#include "ItemsXmlWriter.hpp"
#include "ServerItemsService.hpp"
#include "common/Configuration.hpp"
#include "common/Logger.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

// otitems-tool - loads an items.otb (and optionally its items.xml), reports what it found
// and optionally writes both files back out, normalised, to another directory.
// Handy for checking a server's item database before committing it, and for converting
// items.xml between the conventions of different server dialects.

template <>
struct fmt::formatter<lyra::cli> : ostream_formatter {};

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error(fmt::format("Unable to open {}", path.string()));
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const fs::path &path, const char *data, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out || !out.write(data, static_cast<std::streamsize>(size)))
        throw std::runtime_error(fmt::format("Unable to write {}", path.string()));
}

void list_servers() {
    for (const auto &[server, label] : otitems::AttributeServers::available_with_labels()) {
        const auto metadata = otitems::AttributeServers::metadata(server);
        fmt::print("{:10} {:10} encoding {:10} {}\n", server, label, metadata->items_xml_encoding,
                   metadata->supports_from_to_id ? "fromid/toid" : "single ids only");
    }
}

int run(const fs::path &otb_path, const std::string &xml_path, const std::string &server, const std::string &out_dir,
        Logger &logger) {
    const auto otb = read_file(otb_path);
    std::optional<std::string> xml;
    if (!xml_path.empty())
        xml = read_file(xml_path);

    otitems::ServerItemsService service(Configuration::singleton().sprite_cache_size());
    const auto result = service.load_server_items(
        gsl::span<const byte>(reinterpret_cast<const byte *>(otb.data()), otb.size()), xml, server);
    const auto &items = *result.items;
    logger.info("{}: OTB {}.{}.{}, client {}, {} items (ids {}-{})", otb_path.string(), items.version.major_version,
                items.version.minor_version, items.version.build_number, items.version.client_version, items.size(),
                items.min_id(), items.max_id());
    if (xml && !result.xml_loaded) {
        logger.error("{} is not well-formed XML", xml_path);
        return 1;
    }

    if (out_dir.empty())
        return 0;
    const auto saved = service.save_server_items();
    const fs::path out(out_dir);
    fs::create_directories(out);
    write_file(out / "items.otb", reinterpret_cast<const char *>(saved.otb.data()), saved.otb.size());
    const auto encoded = otitems::encode_items_xml(saved.xml, saved.xml_encoding);
    write_file(out / "items.xml", encoded.data(), encoded.size());
    logger.info("Wrote {} and {}", (out / "items.otb").string(), (out / "items.xml").string());
    return 0;
}

}

int main(int argc, const char **argv) {
    try {
        set_log_level(Configuration::singleton().log_level());
    } catch (const std::invalid_argument &e) {
        fmt::print(stderr, "{}\n", e.what());
        exit(1);
    }
    auto logger = logger_for("otitems");
    bool help{};
    bool verbose{};
    bool servers{};
    std::string server = Configuration::singleton().attribute_server();
    std::string xml_path;
    std::string out_dir;
    std::string otb_path;
    auto cli = lyra::cli()
               | lyra::help(help).description("Check and normalise OpenTibia items.otb and items.xml files")
               | lyra::opt(verbose)["-V"]("verbose logging")
               | lyra::opt(servers)["--list-servers"]("list the known items.xml server dialects")
               | lyra::opt(server, "server")["-s"]["--server"](fmt::format("items.xml dialect (default {})", server))
               | lyra::opt(xml_path, "items.xml")["-x"]["--xml"]("items.xml to load alongside the OTB")
               | lyra::opt(out_dir, "dir")["-o"]["--out"]("write items.otb and items.xml to this directory")
               | lyra::arg(otb_path, "items.otb")("the OTB file to load");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print(stderr, "Error in command line: {}\n", result.message());
        exit(1);
    } else if (help) {
        fmt::print("{}", cli);
        exit(0);
    }
    if (servers) {
        list_servers();
        exit(0);
    }
    if (otb_path.empty()) {
        fmt::print(stderr, "Error in command line: no items.otb given\n{}", cli);
        exit(1);
    }
    if (verbose) {
        set_log_level(spdlog::level::debug);
        logger.set_level(spdlog::level::debug);
    }

    try {
        return run(otb_path, xml_path, server, out_dir, logger);
    } catch (const std::exception &e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}
