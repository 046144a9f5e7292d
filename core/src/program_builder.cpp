// Shaderlay - Program Builder diagnostics

#include <shaderlay/program_builder.h>
#include <shaderlay/shader_wrapper.h>
#include <regex>
#include <sstream>

namespace shaderlay {

const char* stageName(CompileError::Stage stage) {
    switch (stage) {
        case CompileError::Stage::Vertex:   return "vertex";
        case CompileError::Stage::Fragment: return "fragment";
        case CompileError::Stage::Link:     return "link";
    }
    return "unknown";
}

std::string CompileError::describe() const {
    std::ostringstream ss;
    ss << stageName(stage) << " error";
    if (line > 0) {
        ss << " at line " << line;
        if (column > 0) ss << ":" << column;
    }
    ss << ": " << message;
    return ss.str();
}

CompileError parseCompileDiagnostic(CompileError::Stage stage, const std::string& diagnostic,
                                    const std::string& body) {
    CompileError err;
    err.stage = stage;
    err.log = diagnostic;

    // naga/codespan format:   ┌─ glsl:42:5
    std::regex codespanRegex(R"(\S+:(\d+):(\d+))");
    // GL driver format: ERROR: 0:42: message
    std::regex glRegex(R"(ERROR:\s*\d+:(\d+):)");

    std::istringstream stream(diagnostic);
    std::string line;
    bool located = false;

    while (std::getline(stream, line)) {
        if (err.message.empty()) {
            auto start = line.find_first_not_of(" \t");
            if (start != std::string::npos) {
                err.message = line.substr(start);
            }
        }
        if (located) continue;

        std::smatch match;
        if (std::regex_search(line, match, codespanRegex)) {
            err.line = mapToBodyLine(std::stoi(match[1].str()), body);
            err.column = err.line > 0 ? std::stoi(match[2].str()) : 0;
            located = true;
        } else if (std::regex_search(line, match, glRegex)) {
            err.line = mapToBodyLine(std::stoi(match[1].str()), body);
            located = true;
        }
    }

    if (err.message.empty()) {
        err.message = "unknown error";
    }
    return err;
}

} // namespace shaderlay
