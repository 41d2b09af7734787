#ifndef PYTHON_BINDINGS_PYTHON_BINDINGS_HPP_
#define PYTHON_BINDINGS_PYTHON_BINDINGS_HPP_

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../src/compare.hpp"
#include "../src/cpu_count.hpp"
#include "../src/exceptions.hpp"
#include "../src/parallel_sort.hpp"
#include "../src/sequential_sort.hpp"

namespace py = pybind11;

using Comparator = Compare::Function<int64_t>;

PYBIND11_MODULE(forkmerge, m)
{
    m.doc() = "Sequential and fork-join parallel merge sort";

    py::register_exception<InvalidValueException>(m, "InvalidValueException", PyExc_ValueError);

    m.def(
        "sort",
        [](std::vector<int64_t> values,
           bool reverse,
           py::object threads,
           py::object begin,
           py::object end,
           uint64_t min_chunk) {
            auto options = ParallelSort::CustomOrder<int64_t>(
                reverse ? Comparator(Compare::ReverseOrder<int64_t>())
                        : Comparator(Compare::NaturalOrder<int64_t>()));
            // None keeps one thread per logical CPU; 0 sorts on one thread.
            if (!threads.is_none()) {
                options.Threads(threads.cast<uint32_t>());
            }
            options.MinChunkSize(min_chunk);
            if (!begin.is_none() || !end.is_none()) {
                uint64_t const range_begin = begin.is_none() ? 0 : begin.cast<uint64_t>();
                uint64_t const range_end = end.is_none() ? values.size() : end.cast<uint64_t>();
                options.SetRange(range_begin, range_end);
            }
            auto array = ParallelSort::Share(std::move(values));

            std::vector<int64_t> sorted;
            {
                py::gil_scoped_release release;
                sorted = options.Run(array);
            }
            return sorted;
        },
        py::arg("values"),
        py::arg("reverse") = false,
        py::arg("threads") = py::none(),
        py::arg("begin") = py::none(),
        py::arg("end") = py::none(),
        py::arg("min_chunk") = ParallelSort::kDefaultMinChunk);

    m.def(
        "sequential_sort",
        [](const std::vector<int64_t> &values, bool reverse) {
            py::gil_scoped_release release;
            if (reverse) {
                return SequentialSort::SortBy(values, Compare::ReverseOrder<int64_t>());
            }
            return SequentialSort::Sort(values);
        },
        py::arg("values"),
        py::arg("reverse") = false);

    m.def("logical_cpus", &CpuCount::Logical);
    m.def("physical_cpus", &CpuCount::Physical);
}

#endif  // PYTHON_BINDINGS_PYTHON_BINDINGS_HPP_
