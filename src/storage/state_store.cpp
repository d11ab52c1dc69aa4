#include "storage/state_store.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <cstdio>
#include <fstream>

namespace wttp {

StateStore::StateStore(ChunkStore &chunks, ChunkRegistry &registry,
                       AccessControl &access, ResourceCatalog &catalog)
    : chunks_(chunks), registry_(registry), access_(access),
      catalog_(catalog) {}

YAML::Node StateStore::snapshot() const {
  YAML::Node node;
  node["format"] = FORMAT;
  node["chunks"] = chunks_.exportState();
  node["registry"] = registry_.exportState();
  node["access"] = access_.exportState();
  node["catalog"] = catalog_.exportState();
  return node;
}

void StateStore::restore(const YAML::Node &node) {
  if (!node["format"] || node["format"].as<std::string>() != FORMAT) {
    ThrowInvalidState("Unsupported state format");
  }
  // Chunks first: the catalog checks every referenced address.
  chunks_.importState(node["chunks"]);
  registry_.importState(node["registry"]);
  access_.importState(node["access"]);
  catalog_.importState(node["catalog"]);
}

bool StateStore::save(const std::string &path) const {
  YAML::Emitter out;
  out << snapshot();
  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs.is_open()) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Could not open state file for writing",
                                {{"file", tmp}});
      return false;
    }
    ofs << out.c_str() << '\n';
    if (!ofs.good()) {
      Logger::getInstance().log(LogLevel::ERROR, "Failed writing state file",
                                {{"file", tmp}});
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    Logger::getInstance().log(LogLevel::ERROR, "Failed to replace state file",
                              {{"file", path}});
    std::remove(tmp.c_str());
    return false;
  }
  Logger::getInstance().log(LogLevel::INFO, "State saved",
                            {{"file", path},
                             {"chunks", std::to_string(chunks_.chunkCount())}});
  return true;
}

bool StateStore::load(const std::string &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::WARN, "Could not load state file",
                              {{"file", path}, {"reason", e.what()}});
    return false;
  }
  try {
    restore(node);
  } catch (const WttpException &) {
    throw;
  } catch (const std::exception &e) {
    ThrowInvalidState("Corrupt state file " + path + ": " + e.what());
  }
  Logger::getInstance().log(LogLevel::INFO, "State loaded",
                            {{"file", path},
                             {"chunks", std::to_string(chunks_.chunkCount())}});
  return true;
}

} // namespace wttp
