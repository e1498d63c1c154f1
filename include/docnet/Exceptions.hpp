#pragma once
#include <stdexcept>
#include <string>

namespace docnet {

// Root of every error thrown by the store.
struct DocNetError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A null handle (or a non-object seed) was given where a vertex/edge was expected
struct TypeMismatch : DocNetError {
    using DocNetError::DocNetError;
};

// The insertion state of a vertex or edge is wrong for the operation.
// Depending on the situation it may be inserted, not inserted, or inserted
// in another store.
struct VertexInsertionError : DocNetError {
    using DocNetError::DocNetError;
};

struct AlreadyInserted : VertexInsertionError {
    using VertexInsertionError::VertexInsertionError;
};

struct NotInserted : VertexInsertionError {
    using VertexInsertionError::VertexInsertionError;
};

// Edge endpoints must be attached before the edge can exist
struct VertexNotInserted : NotInserted {
    using NotInserted::NotInserted;
};

struct NotReady : DocNetError {
    using DocNetError::DocNetError;
};

struct StillConnected : DocNetError {
    using DocNetError::DocNetError;
};

struct NotFound : DocNetError {
    using DocNetError::DocNetError;
};

// Thrown by Vertex field access. search() treats it as "no match".
struct MissingField : NotFound {
    explicit MissingField(const std::string& field)
        : NotFound("field '" + field + "' not found"), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

struct InvalidDirection : DocNetError {
    using DocNetError::DocNetError;
};

struct AnchorMismatch : DocNetError {
    using DocNetError::DocNetError;
};

struct CorruptSnapshot : DocNetError {
    using DocNetError::DocNetError;
};

struct StorageError : DocNetError {
    using DocNetError::DocNetError;
};

struct ConfigError : DocNetError {
    using DocNetError::DocNetError;
};

}
