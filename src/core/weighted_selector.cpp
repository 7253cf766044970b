#include "core/weighted_selector.h"

namespace runthrough {

const char* selectionErrorString(SelectionError error) {
  switch (error) {
    case SelectionError::OK: return "OK";
    case SelectionError::InvalidWeight: return "Negative selection weight";
  }
  return "Unknown selection error";
}

}  // namespace runthrough
