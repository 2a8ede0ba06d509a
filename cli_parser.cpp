#include "cli_parser.hpp"

#include <stdexcept>

namespace sonicpx {

    void CliParser::parse(int argc, char** argv)
    {
        kv_.clear();
        positionals_.clear();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i] ? argv[i] : "";
            if (a.rfind("--", 0) == 0) {
                std::string key = a.substr(2);
                std::string val = "true";
                if (i + 1 < argc) {
                    std::string next = argv[i + 1] ? argv[i + 1] : "";
                    if (next.rfind("--", 0) != 0) {
                        val = next;
                        ++i;
                    }
                }
                kv_[key] = val;
            } else {
                positionals_.push_back(a);
            }
        }
    }

    bool CliParser::has(const std::string& key) const
    {
        return kv_.find(key) != kv_.end();
    }

    std::string CliParser::get(const std::string& key, const std::string& def) const
    {
        auto it = kv_.find(key);
        if (it == kv_.end()) return def;
        return it->second;
    }

    int CliParser::getInt(const std::string& key, int def) const
    {
        auto it = kv_.find(key);
        if (it == kv_.end()) return def;
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used != it->second.size()) {
            throw std::invalid_argument("--" + key + " expects an integer, got " + it->second);
        }
        return v;
    }

}
