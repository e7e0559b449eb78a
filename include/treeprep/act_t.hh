#pragma once

namespace treeprep {

enum class act_t {
  log,   // record the decision only
  apply  // record and mutate the tree
};

}  // namespace treeprep
