#include <markscan/core/page_result.hpp>

namespace markscan::core {

std::string_view to_string(PageStatus status) noexcept {
  switch (status) {
    case PageStatus::Classified:
      return "classified";
    case PageStatus::Unaligned:
      return "unaligned";
    case PageStatus::Halted:
      return "halted";
  }
  return "unknown";
}

PageResult finish(const PageState& state, PageStatus status) {
  PageResult r;
  r.page_id = state.page_id;
  r.page_name = state.page_name;
  r.status = status;
  r.anchors = state.anchors;
  r.alignment = state.alignment;
  r.issues = state.issues;
  return r;
}

}  // namespace markscan::core
