#pragma once

// Shaderlay - Program Builder
// Compiles and links a fragment body against the fixed uniform contract

#include <memory>
#include <string>

namespace shaderlay {

struct CompileError {
    enum class Stage { Vertex, Fragment, Link };

    Stage stage = Stage::Fragment;
    int line = 0;        // Line within the user body, 0 if unknown or in the wrapper
    int column = 0;
    std::string message; // First line of the backend diagnostic
    std::string log;     // Full backend diagnostic

    std::string describe() const;
};

const char* stageName(CompileError::Stage stage);

// Parse a backend diagnostic into a CompileError, mapping the first
// line:column reference that points into the body.
CompileError parseCompileDiagnostic(CompileError::Stage stage, const std::string& diagnostic,
                                    const std::string& body);

// Linked GPU program, owned by the render loop.
// Bound 1:1 to the body it was built from.
class CompiledProgram {
public:
    explicit CompiledProgram(std::string body) : m_body(std::move(body)) {}
    virtual ~CompiledProgram() = default;

    // Non-copyable
    CompiledProgram(const CompiledProgram&) = delete;
    CompiledProgram& operator=(const CompiledProgram&) = delete;

    const std::string& body() const { return m_body; }

private:
    std::string m_body;
};

struct BuildResult {
    std::unique_ptr<CompiledProgram> program;  // Null on failure
    CompileError error;

    bool ok() const { return program != nullptr; }
};

class ProgramBuilder {
public:
    virtual ~ProgramBuilder() = default;

    // Never throws. On failure the result carries the error and no
    // existing program is affected.
    virtual BuildResult build(const std::string& body) = 0;
};

} // namespace shaderlay
