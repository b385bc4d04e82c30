#pragma once

#include "board/core/board_constants.h"
#include "board/document/document.h"

#include <cstddef>
#include <vector>

namespace board {

// Groups the document's transaction records into undo steps.
//
// Baseline transactions are one step each and close any open capture.
// Gesture, Drag and TextEdit transactions coalesce with the previous step
// while it was opened by the same origin. Agent commits are always a step of
// their own. Remote and History transactions are never recorded.
class UndoRedoManager {
public:
    explicit UndoRedoManager(Document& doc, std::size_t capacity = constants::UNDO_STACK_CAP);
    ~UndoRedoManager();

    UndoRedoManager(const UndoRedoManager&) = delete;
    UndoRedoManager& operator=(const UndoRedoManager&) = delete;

    bool canUndo() const noexcept { return !undo_.empty(); }
    bool canRedo() const noexcept { return !redo_.empty(); }
    std::size_t undoDepth() const noexcept { return undo_.size(); }
    std::size_t redoDepth() const noexcept { return redo_.size(); }

    bool undo();
    bool redo();

    // Close the open step; the next tracked transaction starts a new one.
    void stopCapturing() noexcept { captureOpen_ = false; }

    void clear();

private:
    struct Step {
        TransactionOrigin origin;
        std::vector<DocTransaction> records;
    };

    void onTransaction(const DocTransaction& record);

    Document& doc_;
    Document::ListenerHandle listener_;
    std::size_t capacity_;
    std::vector<Step> undo_;
    std::vector<Step> redo_;
    bool captureOpen_ = false;
};

} // namespace board
