#pragma once

#include <memory>

namespace coord::core { class ProjectSpace; }

namespace coord::service {

/*
  Dependency container shared by the service front ends.
*/
struct ServiceContext {
  std::shared_ptr<coord::core::ProjectSpace> projects;
};

}
