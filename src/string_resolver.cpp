#include "gffkit/string_resolver.hpp"

#include "gffkit/gff.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

namespace gffkit {

void MapStringResolver::add(std::uint32_t string_ref, std::string text) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    entries_[string_ref] = std::move(text);
}

std::string MapStringResolver::resolve(std::uint32_t string_ref) const {
    ++lookups_;
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = entries_.find(string_ref);
    if (it == entries_.end()) {
        throw GffError(ErrorKind::Lookup, "string reference " + std::to_string(string_ref) + " not found");
    }
    return it->second;
}

std::size_t MapStringResolver::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return entries_.size();
}

std::size_t MapStringResolver::load(const std::filesystem::path& file) {
    std::ifstream is(file);
    if (!is) throw GffError(ErrorKind::Io, "failed to open string table: " + file.string());

    std::size_t added = 0;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(is, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        const auto tab = line.find('\t');
        const std::string id_text = line.substr(0, tab);
        std::uint32_t id = 0;
        try {
            std::size_t used = 0;
            const unsigned long v = std::stoul(id_text, &used, 10);
            if (used != id_text.size() || v > 0xFFFFFFFFul) throw std::out_of_range("id");
            id = static_cast<std::uint32_t>(v);
        } catch (const std::logic_error&) {
            std::ostringstream oss;
            oss << file.string() << ":" << lineno << ": bad string id '" << id_text << "'";
            throw GffError(ErrorKind::InvalidNumber, oss.str());
        }
        add(id, tab == std::string::npos ? std::string() : line.substr(tab + 1));
        ++added;
    }
    return added;
}

} // namespace gffkit
