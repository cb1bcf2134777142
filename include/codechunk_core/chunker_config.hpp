#pragma once

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace codechunk_core {

// Content-length bucket for the generic splitting path. A tier without a
// target size means "do not split".
struct SizeTier {
  std::string name;
  size_t min_length = 0;
  std::optional<size_t> max_length;  // exclusive; unset means unbounded
  std::optional<size_t> target_size;
  size_t overlap = 0;

  bool contains(size_t length) const {
    return length >= min_length && (!max_length || length < *max_length);
  }
};

class ChunkerConfig {
 public:
  bool enable_dynamic_sizing = true;
  std::vector<SizeTier> size_tiers = default_size_tiers();
  std::string structural_language = "java";
  int min_structural_members = 2;
  double single_chunk_tolerance = 1.2;
  std::vector<std::string> keyword_denylist = default_keyword_denylist();
  bool verbose_logging = false;

  static std::vector<SizeTier> default_size_tiers() {
    return {{"tiny", 0, 500, std::nullopt, 0},
            {"small", 500, 2000, 1000, 0},
            {"medium", 2000, 10000, 1500, 0},
            {"large", 10000, std::nullopt, 2000, 0}};
  }

  static std::vector<std::string> default_keyword_denylist() {
    return {"return", "if",    "else",    "for",   "while", "switch",
            "case",   "try",   "catch",   "finally", "throw", "new"};
  }

  // Returns the tier whose range holds the given length, or nullptr
  const SizeTier* select_tier(size_t length) const {
    for (const auto& tier : size_tiers) {
      if (tier.contains(length)) {
        return &tier;
      }
    }
    return nullptr;
  }

  // Load configuration from a JSON file at the given path
  static ChunkerConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static ChunkerConfig from_json(const nlohmann::json& json_config) {
    ChunkerConfig config;

    try {
      config.enable_dynamic_sizing = json_config.value("enable_dynamic_sizing", true);
      config.structural_language =
          json_config.value("structural_language", std::string("java"));
      config.min_structural_members = json_config.value("min_structural_members", 2);
      config.single_chunk_tolerance = json_config.value("single_chunk_tolerance", 1.2);
      config.verbose_logging = json_config.value("verbose_logging", false);

      if (json_config.contains("keyword_denylist")) {
        config.keyword_denylist =
            json_config.at("keyword_denylist").get<std::vector<std::string>>();
      }

      if (json_config.contains("size_tiers")) {
        config.size_tiers.clear();
        for (const auto& tier_json : json_config.at("size_tiers")) {
          SizeTier tier;
          tier.name = tier_json.value("name", std::string("tier"));
          tier.min_length = tier_json.value("min", static_cast<size_t>(0));
          if (tier_json.contains("max") && !tier_json.at("max").is_null()) {
            tier.max_length = tier_json.at("max").get<size_t>();
          }
          if (tier_json.contains("target_size") && !tier_json.at("target_size").is_null()) {
            tier.target_size = tier_json.at("target_size").get<size_t>();
          }
          tier.overlap = tier_json.value("overlap", static_cast<size_t>(0));
          config.size_tiers.push_back(tier);
        }
      }
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid chunker configuration: ") + e.what());
    }

    config.validate();
    return config;
  }

  nlohmann::json to_json() const {
    nlohmann::json tiers = nlohmann::json::array();
    for (const auto& tier : size_tiers) {
      tiers.push_back({{"name", tier.name},
                       {"min", tier.min_length},
                       {"max", tier.max_length ? nlohmann::json(*tier.max_length) : nullptr},
                       {"target_size",
                        tier.target_size ? nlohmann::json(*tier.target_size) : nullptr},
                       {"overlap", tier.overlap}});
    }
    return {{"enable_dynamic_sizing", enable_dynamic_sizing},
            {"size_tiers", tiers},
            {"structural_language", structural_language},
            {"min_structural_members", min_structural_members},
            {"single_chunk_tolerance", single_chunk_tolerance},
            {"keyword_denylist", keyword_denylist},
            {"verbose_logging", verbose_logging}};
  }

 private:
  void validate() const {
    if (size_tiers.empty()) {
      throw std::runtime_error("size_tiers cannot be empty");
    }
    if (size_tiers.front().min_length != 0) {
      throw std::runtime_error("the first size tier must start at 0");
    }
    for (size_t i = 0; i < size_tiers.size(); ++i) {
      const SizeTier& tier = size_tiers[i];
      if (tier.max_length && *tier.max_length <= tier.min_length) {
        throw std::runtime_error("size tier '" + tier.name + "' has an empty range");
      }
      if (tier.target_size && *tier.target_size == 0) {
        throw std::runtime_error("size tier '" + tier.name + "' target_size must be positive");
      }
      if (tier.target_size && tier.overlap >= *tier.target_size) {
        throw std::runtime_error("size tier '" + tier.name +
                                 "' overlap must be smaller than target_size");
      }
      bool is_last = i + 1 == size_tiers.size();
      if (!is_last) {
        if (!tier.max_length || *tier.max_length != size_tiers[i + 1].min_length) {
          throw std::runtime_error("size tier '" + tier.name +
                                   "' must end where the next tier starts");
        }
      } else if (tier.max_length) {
        throw std::runtime_error("the last size tier must be unbounded");
      }
    }
    if (structural_language.empty()) {
      throw std::runtime_error("structural_language cannot be empty");
    }
    if (min_structural_members < 1) {
      throw std::runtime_error("min_structural_members must be at least 1");
    }
    if (single_chunk_tolerance < 1.0) {
      throw std::runtime_error("single_chunk_tolerance must be at least 1.0");
    }
  }
};

}  // namespace codechunk_core
