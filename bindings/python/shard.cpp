#include "shard/shard.hh"

#include <pybind11/iostream.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

#define pystdout py::module_::import("sys").attr("stdout")
#define pystderr py::module_::import("sys").attr("stderr")

using shard::Chunk;
using shard::Chunker;
using shard::Chunks;
using shard::ChunkStream;
using shard::Range;
using shard::Record;
using shard::Summary;

using Config = shard::Chunker::Config;

class Redirect {
 public:
  Redirect() : out_(std::cout, pystdout), err_(std::cerr, pystderr) {}

 public:
  py::scoped_ostream_redirect out_;
  py::scoped_ostream_redirect err_;
};

// Chunks many records on worker threads, returned in the order given.
class PyService {
 public:
  PyService(const Config &config, size_t workers)
      : chunker_(config), service_(chunker_, workers) {}

  std::vector<Chunks> chunk(std::vector<Record> records) {
    Redirect redirect;
    py::gil_scoped_release release;

    std::vector<shard::Future> futures;
    futures.reserve(records.size());
    for (Record &record : records) {
      futures.push_back(service_.submit(std::move(record)));
    }

    std::vector<Chunks> chunks;
    chunks.reserve(futures.size());
    for (auto &future : futures) {
      chunks.push_back(future.get());
    }
    return chunks;
  }

 private:
  Chunker chunker_;
  shard::Async service_;
};

PYBIND11_MODULE(_shard, m) {
  m.doc() = "shard python bindings";
  m.attr("__version__") = shard::version();

  py::class_<Range>(m, "Range")
      .def(py::init<>([](size_t begin, size_t end) {
             return Range{begin, end};
           }),
           py::arg("begin"), py::arg("end"))
      .def_readonly("begin", &Range::begin)
      .def_readonly("end", &Range::end)
      .def("__eq__", [](const Range &a, const Range &b) { return a == b; })
      .def("__repr__", [](const Range &range) {
        return "{" + std::to_string(range.begin) + ", " +
               std::to_string(range.end) + "}";
      });

  py::class_<Record>(m, "Record")
      .def(py::init<>([](std::string key, std::string date, std::string name,
                         std::string transcript, size_t index) {
             Record record;
             record.key = std::move(key);
             record.date = std::move(date);
             record.name = std::move(name);
             record.transcript = std::move(transcript);
             record.index = index;
             return record;
           }),
           py::arg("key"), py::arg("date") = "", py::arg("name") = "",
           py::arg("transcript") = "", py::arg("index") = 0)
      .def_readwrite("key", &Record::key)
      .def_readwrite("date", &Record::date)
      .def_readwrite("name", &Record::name)
      .def_readwrite("transcript", &Record::transcript)
      .def_readwrite("index", &Record::index)
      .def_readwrite("source", &Record::source);

  py::class_<Chunk>(m, "Chunk")
      .def_readonly("key", &Chunk::key)
      .def_readonly("date", &Chunk::date)
      .def_readonly("name", &Chunk::name)
      .def_readonly("index", &Chunk::index)
      .def_readonly("id", &Chunk::id)
      .def_readonly("begin", &Chunk::begin)
      .def_readonly("end", &Chunk::end)
      .def_readonly("text", &Chunk::text)
      .def("__repr__", [](const Chunk &chunk) {
        return "Chunk(" + chunk.key + ", " + std::to_string(chunk.index) +
               ", {" + std::to_string(chunk.begin) + ", " +
               std::to_string(chunk.end) + "})";
      });

  py::class_<Summary>(m, "Summary")
      .def_readonly("key", &Summary::key)
      .def_readonly("date", &Summary::date)
      .def_readonly("name", &Summary::name)
      .def_readonly("length", &Summary::length)
      .def_readonly("chunk_count", &Summary::chunk_count)
      .def_readonly("source", &Summary::source);

  py::class_<Config>(m, "Config")
      .def(py::init<>([](int max_chars, int overlap_chars) {
             Config config;
             config.max_chars = max_chars;
             config.overlap_chars = overlap_chars;
             return config;
           }),
           py::arg("max_chars") = 1200, py::arg("overlap_chars") = 200)
      .def_readwrite("max_chars", &Config::max_chars)
      .def_readwrite("overlap_chars", &Config::overlap_chars);

  py::class_<Chunker>(m, "Chunker")
      .def(py::init<const Config &>(), py::arg("config") = Config())
      .def("chunk",
           py::overload_cast<const Record &>(&Chunker::chunk, py::const_),
           py::arg("record"))
      .def("config", &Chunker::config);

  py::class_<ChunkStream>(m, "ChunkStream")
      .def(py::init<std::vector<Record>, const Chunker &>(), py::arg("records"),
           py::arg("chunker"), py::keep_alive<1, 3>())
      .def(
          "__iter__",
          [](const ChunkStream &stream) {
            // The iterator reuses its buffer, so hand out copies.
            return py::make_iterator<py::return_value_policy::copy>(
                stream.begin(), stream.end());
          },
          py::keep_alive<0, 1>());

  py::class_<PyService>(m, "Service")
      .def(py::init<const Config &, size_t>(), py::arg("config") = Config(),
           py::arg("workers") = 1)
      .def("chunk", &PyService::chunk, py::arg("records"));

  m.def(
      "normalize", [](const std::string &raw) { return shard::normalize(raw); },
      py::arg("raw"));
  m.def("stable_id", &shard::stable_id, py::arg("key"), py::arg("index"),
        py::arg("text"));
  m.def("normalize_date", &shard::normalize_date, py::arg("value"));
  m.def("meeting_key", &shard::meeting_key, py::arg("name"), py::arg("date"),
        py::arg("index"));
  m.def("summarize", &shard::summarize, py::arg("record"), py::arg("chunks"));
  m.def("discover", &shard::discover, py::arg("paths"));
  m.def("read_record", &shard::read_record, py::arg("path"),
        py::arg("index") = 0);
}
