/*
 * Copyright (C) 2014-2018 Olzhas Rakhimov
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/// @file
/// Implementation of the logic tree reader.

#include "logic_tree_reader.h"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

#include <boost/exception/errinfo_file_name.hpp>
#include <boost/filesystem.hpp>

#include "error.h"
#include "ext/float_compare.h"
#include "logger.h"

namespace tremor::lt {

namespace {

/// The source type names accepted by the source type filter.
const char* const kSourceTypes[] = {"point", "area", "simpleFault",
                                    "complexFault", "characteristicFault"};

/// The filter attributes of branch sets.
const char* const kFilterAttributes[] = {
    "applyToTectonicRegionType", "applyToSourceType", "applyToSources"};

}  // namespace

LogicTreeReader::LogicTreeReader(const std::string& xml_file)
    : filename_(xml_file) {
  TIMER(DEBUG1, "Reading the logic tree");
  if (!boost::filesystem::exists(xml_file))
    TREMOR_THROW(IOError("Input file doesn't exist."))
        << boost::errinfo_file_name(xml_file);

  xml::Document document(xml_file);
  xml::Element logic_tree = document.root();
  if (logic_tree.name() != "logicTree") {
    std::optional<xml::Element> child = logic_tree.child("logicTree");
    if (!child)
      TREMOR_THROW(MakeError(logic_tree, "missing 'logicTree' node"));
    logic_tree = *child;
  }

  for (const xml::Element& node : logic_tree.children()) {
    if (node.name() == "logicTreeBranchingLevel") {
      auto nodes = node.children("logicTreeBranchSet");
      ProcessLevel(std::vector<xml::Element>(nodes.begin(), nodes.end()));
    } else if (node.name() == "logicTreeBranchSet") {
      ProcessLevel({node});
    } else {
      TREMOR_THROW(MakeError(node, "unexpected node in the logic tree"))
          << xml::errinfo_element(std::string(node.name()));
    }
  }
  if (!root_)
    TREMOR_THROW(MakeError(logic_tree, "the logic tree has no branch sets"));
  LOG(DEBUG2) << "The logic tree has " << open_leaves_.size() << " leaves";
}

void LogicTreeReader::ProcessLevel(
    const std::vector<xml::Element>& branch_set_nodes) {
  std::vector<Branch*> new_leaves;
  for (const xml::Element& node : branch_set_nodes) {
    std::unique_ptr<BranchSet> branch_set = ConstructBranchSet(node);
    if (!root_) {
      if (node.has_attribute("applyToBranches"))
        TREMOR_THROW(MakeError(
            node, "the root branch set cannot apply to branches"))
            << errinfo_branchset_id(branch_set->branchset_id());
      root_ = std::move(branch_set);
      for (Branch& branch : root_->branches())
        new_leaves.push_back(&branch);
      continue;
    }
    for (Branch* leaf : GetTargets(node)) {
      leaf->child(std::make_unique<BranchSet>(*branch_set));
      for (Branch& branch : leaf->child()->branches())
        new_leaves.push_back(&branch);
    }
    LOG(DEBUG3) << "Attached branch set " << branch_set->branchset_id();
  }
  // The targets are closed now.
  open_leaves_.erase(
      std::remove_if(open_leaves_.begin(), open_leaves_.end(),
                     [](const Branch* leaf) { return leaf->child(); }),
      open_leaves_.end());
  open_leaves_.insert(open_leaves_.end(), new_leaves.begin(),
                      new_leaves.end());
}

std::vector<Branch*> LogicTreeReader::GetTargets(const xml::Element& node) {
  std::vector<Branch*> targets;
  for (Branch* leaf : open_leaves_) {
    if (!leaf->child())
      targets.push_back(leaf);
  }
  std::string_view apply_to = node.attribute("applyToBranches");
  if (apply_to.empty()) {
    if (targets.empty())
      TREMOR_THROW(MakeError(node, "no open branches to apply to"));
    return targets;
  }

  std::vector<Branch*> chosen;
  for (std::string_view branch_id : xml::detail::split(apply_to)) {
    auto prev_size = chosen.size();
    for (Branch* leaf : targets) {
      if (leaf->branch_id() == branch_id)
        chosen.push_back(leaf);
    }
    if (chosen.size() == prev_size)
      TREMOR_THROW(MakeError(node, "applyToBranches refers to a branch "
                                   "that is undefined or not a leaf"))
          << errinfo_branch_id(std::string(branch_id));
  }
  return chosen;
}

std::unique_ptr<BranchSet> LogicTreeReader::ConstructBranchSet(
    const xml::Element& node) {
  std::string branchset_id(node.attribute("branchSetID"));
  if (branchset_id.empty())
    TREMOR_THROW(MakeError(node, "missing branchSetID"));
  if (!branchset_ids_.insert(branchset_id).second)
    TREMOR_THROW(MakeError(node, "branchSetID is not unique"))
        << errinfo_branchset_id(branchset_id);

  std::string type_string(node.attribute("uncertaintyType"));
  UncertaintyType type = GetUncertaintyType(type_string);
  if (type == UncertaintyType::kUnknown)
    TREMOR_THROW(MakeError(node, "unknown uncertainty type"))
        << errinfo_uncertainty(type_string)
        << errinfo_branchset_id(branchset_id);

  bool collapsed = false;
  try {
    collapsed = node.attribute<bool>("collapsed").value_or(false);
  } catch (const xml::ValidityError&) {
    TREMOR_THROW(MakeError(node, "expected boolean 'collapsed' value"))
        << errinfo_value(std::string(node.attribute("collapsed")))
        << errinfo_branchset_id(branchset_id);
  }

  Filters filters;
  for (const char* key : kFilterAttributes) {
    std::string_view value = node.attribute(key);
    if (!value.empty())
      filters.emplace(key, value);
  }
  if (auto it = filters.find("applyToSourceType"); it != filters.end()) {
    if (std::find(std::begin(kSourceTypes), std::end(kSourceTypes),
                  it->second) == std::end(kSourceTypes))
      TREMOR_THROW(MakeError(node, "unknown source type"))
          << errinfo_filter(it->first) << errinfo_value(it->second)
          << errinfo_branchset_id(branchset_id);
  }
  BLOG(WARNING, !filters.empty() && !IsApplicableToSources(type))
      << "Branch set " << branchset_id << " of " << type_string
      << " has source filters that never apply";

  auto branch_set = std::make_unique<BranchSet>(type, branchset_id,
                                                std::move(filters), collapsed);
  for (const xml::Element& branch_node : node.children("logicTreeBranch")) {
    std::string branch_id(branch_node.attribute("branchID"));
    if (branch_id.empty())
      TREMOR_THROW(MakeError(branch_node, "missing branchID"));
    if (!branch_ids_.insert(branch_id).second)
      TREMOR_THROW(MakeError(branch_node, "branchID is not unique"))
          << errinfo_branch_id(branch_id);

    std::optional<xml::Element> model_node =
        branch_node.child("uncertaintyModel");
    std::optional<xml::Element> weight_node =
        branch_node.child("uncertaintyWeight");
    if (!model_node || !weight_node)
      TREMOR_THROW(MakeError(branch_node,
                             "expected uncertaintyModel and uncertaintyWeight"))
          << errinfo_branch_id(branch_id);

    double weight = 0;
    try {
      weight = xml::detail::to<double>(weight_node->text());
    } catch (const xml::ValidityError&) {
      TREMOR_THROW(MakeError(*weight_node, "expected single float value"))
          << errinfo_value(std::string(weight_node->text()))
          << errinfo_branch_id(branch_id);
    }
    if (weight <= 0 || weight > 1)
      TREMOR_THROW(MakeError(*weight_node, "weight must be in (0, 1]"))
          << errinfo_value(std::to_string(weight))
          << errinfo_branch_id(branch_id);

    branch_set->Add(Branch(branch_id, weight,
                           ParseUncertainty(type, *model_node, filename_)));
  }

  if (branch_set->branches().empty())
    TREMOR_THROW(MakeError(node, "branch set is empty"))
        << errinfo_branchset_id(branchset_id);
  double total = ext::total_weight(branch_set->branches());
  if (!ext::is_close(1, total, 1e-6))
    TREMOR_THROW(MakeError(node, "branchset weights don't sum up to 1.0"))
        << errinfo_value(std::to_string(total))
        << errinfo_branchset_id(branchset_id);
  return branch_set;
}

}  // namespace tremor::lt
