#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "iim/types.hpp"

namespace iim {

class SectorIndex {
public:
  SectorIndex() = default;
  explicit SectorIndex(std::vector<std::string> names);

  int at(const std::string& name) const;
  bool contains(const std::string& name) const;

  int size() const { return (int)names_.size(); }
  const std::vector<std::string>& names() const { return names_; }
  const std::string& name(int i) const { return names_[(std::size_t)i]; }

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, int> pos_;
};

// Throws InvalidPerturbationError unless 0 <= c <= 1.
void check_fraction(f64 c, const std::string& sector);

// Dense c* aligned with the sector order. All names and values are checked
// before anything is written.
Vec make_perturbation(const SectorIndex& index,
                      const std::vector<std::string>& psector,
                      const Vec& cvalue);

}
