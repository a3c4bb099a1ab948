#include "arbiter/catalog.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "arbiter/errors.h"
#include "arbiter/tree_loader.h"
#include "util/string_util.h"

namespace arbiter {

TreeCatalog TreeCatalog::load_directory(const std::string& dir, const OperatorRegistry& registry) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw std::runtime_error("Tree directory not found: " + dir);
  }
  std::vector<fs::path> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file() && it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw std::runtime_error("Failed to read tree directory " + dir + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  TreeCatalog catalog;
  for (const auto& file : files) {
    DecisionTree tree;
    try {
      tree = load_tree_from_file(file.string(), registry);
    } catch (const AuthoringError& ex) {
      throw AuthoringError(file.filename().string() + ": " + ex.what());
    }
    if (tree.name.empty()) {
      tree.name = file.stem().string();
    }
    catalog.add(std::move(tree));
  }
  return catalog;
}

void TreeCatalog::add(DecisionTree tree) {
  if (tree.name.empty()) {
    throw AuthoringError("Catalog trees must have a name");
  }
  if (trees_.find(tree.name) != trees_.end()) {
    throw AuthoringError("Duplicate tree name in catalog: " + tree.name);
  }
  std::string name = tree.name;
  trees_.emplace(std::move(name), std::make_shared<const DecisionTree>(std::move(tree)));
}

const DecisionTree* TreeCatalog::find(const std::string& name) const {
  auto it = trees_.find(name);
  if (it == trees_.end()) return nullptr;
  return it->second.get();
}

std::vector<std::string> TreeCatalog::names() const {
  std::vector<std::string> out;
  out.reserve(trees_.size());
  for (const auto& kv : trees_) out.push_back(kv.first);
  return out;
}

std::string default_tree_dir() {
  std::string dir = "trees";
  if (const char* env = std::getenv("ARBITER_TREE_DIR")) {
    std::string trimmed = util::trim_ws(env);
    if (!trimmed.empty()) {
      dir = trimmed;
    }
  }
  return dir;
}

}  // namespace arbiter
