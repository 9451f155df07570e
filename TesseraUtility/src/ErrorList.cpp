#include <TesseraUtility/ErrorList.h>

#include <iterator>
#include <string>
#include <utility>

namespace TesseraUtility {

/*static*/ ErrorList ErrorList::error(std::string errorMessage) {
  return ErrorList{{std::move(errorMessage)}, {}};
}

/*static*/ ErrorList ErrorList::warning(std::string warningMessage) {
  return ErrorList{{}, {std::move(warningMessage)}};
}

void ErrorList::merge(const ErrorList& errorList) {
  this->errors.insert(
      this->errors.end(),
      errorList.errors.begin(),
      errorList.errors.end());
  this->warnings.insert(
      this->warnings.end(),
      errorList.warnings.begin(),
      errorList.warnings.end());
}

void ErrorList::merge(ErrorList&& errorList) {
  this->errors.insert(
      this->errors.end(),
      std::make_move_iterator(errorList.errors.begin()),
      std::make_move_iterator(errorList.errors.end()));
  this->warnings.insert(
      this->warnings.end(),
      std::make_move_iterator(errorList.warnings.begin()),
      std::make_move_iterator(errorList.warnings.end()));
  errorList.errors.clear();
  errorList.warnings.clear();
}

bool ErrorList::hasErrors() const noexcept { return !this->errors.empty(); }

bool ErrorList::hasWarnings() const noexcept {
  return !this->warnings.empty();
}

ErrorList::operator bool() const noexcept { return this->hasErrors(); }

} // namespace TesseraUtility
