#include "guardrails/engine_handle.h"

#include "server/logging/logger.h"

#include <stdexcept>

namespace sentinel {

EngineHandle::EngineHandle(std::shared_ptr<const EmbeddingBackend> embedder)
    : embedder_(std::move(embedder)),
      current_(GuardrailEngine::Build(SafetyFloorProfile(), embedder_)) {}

std::shared_ptr<const GuardrailEngine> EngineHandle::Current() const {
  return std::atomic_load(&current_);
}

void EngineHandle::Publish(std::shared_ptr<const GuardrailEngine> engine) {
  std::atomic_store(&current_, std::move(engine));
  switch_count_.fetch_add(1);
}

bool EngineHandle::Switch(const Profile& profile, std::string* error) {
  std::shared_ptr<const GuardrailEngine> engine;
  try {
    engine = GuardrailEngine::Build(profile, embedder_);
  } catch (const std::exception& ex) {
    if (error) {
      *error = std::string("engine build failed: ") + ex.what();
    }
    log::Error("engine", "profile switch to '" + profile.name + "' failed",
               std::string("error=") + ex.what());
    return false;
  }
  auto previous = ActiveProfileName();
  Publish(std::move(engine));
  log::Info("engine", "switched profile",
            "from=" + previous + " to=" + profile.name);
  return true;
}

bool EngineHandle::SwitchFromYaml(const std::string& yaml,
                                  std::string* error) {
  Profile profile;
  std::string reason;
  if (!ParseProfileYaml(yaml, &profile, &reason)) {
    log::Warn("profile", "rejected profile switch", "error=" + reason);
    if (error) {
      *error = reason;
    }
    return false;
  }
  return Switch(profile, error);
}

bool EngineHandle::SwitchFromFile(const std::string& path,
                                  std::string* error) {
  Profile profile;
  std::string reason;
  if (!LoadProfileFile(path, &profile, &reason)) {
    log::Warn("profile", "rejected profile switch",
              "path=" + path + " error=" + reason);
    if (error) {
      *error = reason;
    }
    return false;
  }
  return Switch(profile, error);
}

bool EngineHandle::InitializeFromFile(const std::string& path) {
  std::string error;
  if (SwitchFromFile(path, &error)) {
    return true;
  }
  log::Error("profile", "failed to load profile; using safety floor",
             "path=" + path + " error=" + error);
  Publish(GuardrailEngine::Build(SafetyFloorProfile(), embedder_));
  return false;
}

std::string EngineHandle::ActiveProfileName() const {
  auto engine = Current();
  return engine ? engine->ProfileName() : std::string();
}

}  // namespace sentinel
