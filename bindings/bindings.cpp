#include <pybind11/pybind11.h>

#include "bindings.h"

namespace py = pybind11;

PYBIND11_MODULE(ratinggraph_preprocess_python, m) {
  m.doc() = "Pybind11 bindings for ratinggraph_preprocess";

  auto m_dataloaders = m.def_submodule("dataloaders");
  ratinggraph::bindings::BindSplitBundle(m_dataloaders);
  ratinggraph::bindings::BindLoaders(m_dataloaders);

  auto m_ops = m.def_submodule("ops");
  ratinggraph::bindings::BindNormalization(m_ops);

  auto m_preprocess = m.def_submodule("preprocess");
  ratinggraph::bindings::BindBookCrossingFilter(m_preprocess);

  auto m_utils = m.def_submodule("utils");
  auto m_logging = m_utils.def_submodule("logging");
  ratinggraph::bindings::BindLogging(m_logging);
  auto m_timing = m_utils.def_submodule("timing");
  ratinggraph::bindings::BindTiming(m_timing);
}
