#include "iim/perturbation.hpp"
#include "iim/errors.hpp"
#include "iim/util.hpp"

namespace iim {

SectorIndex::SectorIndex(std::vector<std::string> names) : names_(std::move(names)) {
  pos_.reserve(names_.size());
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (!pos_.emplace(names_[i], (int)i).second) throw InputShapeError("duplicate sector name: " + names_[i]);
  }
}

int SectorIndex::at(const std::string& name) const {
  auto it = pos_.find(name);
  if (it == pos_.end()) throw UnknownSectorError(name);
  return it->second;
}

bool SectorIndex::contains(const std::string& name) const {
  return pos_.count(name) != 0;
}

void check_fraction(f64 c, const std::string& sector) {
  if (!is_finite(c) || c < 0.0 || c > 1.0)
    throw InvalidPerturbationError(std::to_string(c) + " not in range [0.0, 1.0] for sector " + sector);
}

Vec make_perturbation(const SectorIndex& index,
                      const std::vector<std::string>& psector,
                      const Vec& cvalue) {
  if (psector.size() != cvalue.size())
    throw InvalidPerturbationError("psector and cvalue have different sizes (" + std::to_string(psector.size()) +
                                   " vs " + std::to_string(cvalue.size()) + ")");

  for (std::size_t k = 0; k < cvalue.size(); ++k) check_fraction(cvalue[k], psector[k]);

  std::vector<int> pos;
  pos.reserve(psector.size());
  for (const auto& name : psector) pos.push_back(index.at(name));

  Vec cstar((std::size_t)index.size(), 0.0);
  for (std::size_t k = 0; k < pos.size(); ++k) cstar[(std::size_t)pos[k]] = cvalue[k];
  return cstar;
}

}
