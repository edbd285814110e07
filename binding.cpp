#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <torch/extension.h>

#include <memory>
#include <string>
#include <string_view>

#include "audio.h"
#include "config.h"
#include "context.h"
#include "engine.h"
#include "error.h"
#include "events.h"
#include "shared_engine.h"
#include "types.h"
#include "voices.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace speak {

// Binding for csrc/error.h
inline void bindError(py::module& m) {
    static py::exception<Error> exc(m, "Error", PyExc_RuntimeError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (Error const& e) {
            // args: (message, code)
            auto args = py::make_tuple(e.what(), e.code);
            PyErr_SetObject(exc.ptr(), args.ptr());
        }
    });
}

// Binding for csrc/config.h
inline void bindConfig(py::module& m) {
    auto mConfig =
        py::class_<EngineConfig>(m, "EngineConfig")
            .def(py::init<>())
            .def_readwrite("dataPath", &EngineConfig::dataPath)
            .def_readwrite("bufferLength", &EngineConfig::bufferLength)
            .def_readwrite("phonemeEvents", &EngineConfig::phonemeEvents)
            .def_readwrite("ipaPhonemes", &EngineConfig::ipaPhonemes)
            .def_readwrite("logLevel", &EngineConfig::logLevel)
            .def_static("fromEnv", &EngineConfig::fromEnv);
    m.def("configure", &SharedEngine::configure, py::arg("config"));
}

// Binding for csrc/engine.h and csrc/voices.h
inline void bindVoices(py::module& m) {
    py::enum_<Gender>(m, "Gender")
        .value("Unknown", Gender::Unknown)
        .value("Male", Gender::Male)
        .value("Female", Gender::Female)
        .value("Neutral", Gender::Neutral);
    auto mLanguage = py::class_<Language>(m, "Language")
                         .def_readwrite("priority", &Language::priority)
                         .def_readwrite("name", &Language::name);
    auto mVoice = py::class_<Voice>(m, "Voice")
                      .def_readwrite("name", &Voice::name)
                      .def_readwrite("languages", &Voice::languages)
                      .def_readwrite("identifier", &Voice::identifier)
                      .def_readwrite("gender", &Voice::gender)
                      .def_readwrite("age", &Voice::age);
    auto mQuery = py::class_<VoiceQuery>(m, "VoiceQuery")
                      .def_readonly("name", &VoiceQuery::name)
                      .def_readonly("language", &VoiceQuery::language)
                      .def_readonly("gender", &VoiceQuery::gender)
                      .def_readonly("age", &VoiceQuery::age)
                      .def_readonly("variant", &VoiceQuery::variant);
    m.def("listVoices", py::overload_cast<>(&listVoices),
          py::call_guard<py::gil_scoped_release>());
    m.def("sampleRate", &sampleRate,
          py::call_guard<py::gil_scoped_release>());
}

// Binding for csrc/events.h
inline void bindEvents(py::module& m) {
    py::enum_<SynthEventType>(m, "SynthEventType")
        .value("Word", SynthEventType::Word)
        .value("Sentence", SynthEventType::Sentence)
        .value("Mark", SynthEventType::Mark)
        .value("Play", SynthEventType::Play)
        .value("End", SynthEventType::End)
        .value("MsgTerminated", SynthEventType::MsgTerminated)
        .value("Phoneme", SynthEventType::Phoneme);
    auto mEvent =
        py::class_<SynthEvent>(m, "SynthEvent")
            .def_property_readonly("type", &SynthEvent::type)
            .def_readonly("textPosition", &SynthEvent::textPosition)
            .def_readonly("audioPosition", &SynthEvent::audioPosition)
            .def_property_readonly("length", &SynthEvent::length)
            .def_property_readonly("number", &SynthEvent::number)
            .def_property_readonly("name", &SynthEvent::name)
            .def_property_readonly("phoneme", &SynthEvent::phoneme)
            .def("__repr__", [](SynthEvent const& e) {
                return "<SynthEvent " + std::string(toString(e.type())) +
                       " at " + std::to_string(e.textPosition) + ">";
            });
}

// Binding for csrc/context.h
inline void bindContext(py::module& m) {
    auto mContext =
        py::class_<Context>(m, "Context")
            .def(py::init<>())
            .def_property("rate", &Context::rate, &Context::setRate)
            .def_property("volume", &Context::volume, &Context::setVolume)
            .def_property("pitch", &Context::pitch, &Context::setPitch)
            .def_property("range", &Context::range, &Context::setRange)
            .def_property_readonly("voice", &Context::voice)
            .def("setVoice", &Context::setVoice, py::arg("name"),
                 py::call_guard<py::gil_scoped_release>())
            .def("setVoiceProperties", &Context::setVoiceProperties,
                 py::arg("name") = "", py::arg("language") = "",
                 py::arg("gender") = Gender::Unknown, py::arg("age") = 0,
                 py::arg("variant") = 0,
                 py::call_guard<py::gil_scoped_release>())
            .def("synthesizeText", &Context::synthesizeText, py::arg("text"),
                 py::call_guard<py::gil_scoped_release>())
            .def_property_readonly("samples", &Context::samples)
            .def_property_readonly("events", &Context::events)
            .def("wave", &Context::wave);
}

// Binding for csrc/audio.h
inline void bindAudio(py::module& m) {
    auto A = m.def_submodule("audio", "Audio Utilities.");
    A.def("resample",
          py::overload_cast<Tensor, double, double, double>(&resample),
          py::arg("inWave"), py::arg("inRate"), py::arg("outRate"),
          py::arg("precision") = 16.0);
}

}  // namespace speak

PYBIND11_MODULE(speakxx_C, m) {
    m.doc() = "SpeakXX Python Binding Module";
    speak::bindError(m);
    speak::bindConfig(m);
    speak::bindVoices(m);
    speak::bindEvents(m);
    speak::bindContext(m);
    speak::bindAudio(m);
}
