#pragma once

#include <pybind11/pybind11.h>

namespace ratinggraph::bindings {

void BindSplitBundle(pybind11::module_& m);
void BindLoaders(pybind11::module_& m);

void BindNormalization(pybind11::module_& m);
void BindBookCrossingFilter(pybind11::module_& m);

void BindLogging(pybind11::module_& m);
void BindTiming(pybind11::module_& m);

}  // namespace ratinggraph::bindings
