#include "findconfig.hpp"
#include "searcherrors.hpp"
#include "sha256calculator.hpp"

void FindUniqueFilesConfig::validate() const {
  if (!includeFileFn) {
    throw ValidationError("includeFileFn cannot be empty");
  }
  if (!foundFileFn) {
    throw ValidationError("foundFileFn cannot be empty");
  }
}

std::unique_ptr<IHashCalculator> FindUniqueFilesConfig::pickHasher() const {
  if (!hasherFn) {
    return std::make_unique<Sha256Calculator>();
  }

  auto calculator = hasherFn();
  if (!calculator) {
    throw ValidationError("hasherFn returned no hash calculator");
  }
  return calculator;
}
