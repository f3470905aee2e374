/**
 * sqlnav/ui/table_state.hpp - Interactive table state engine
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Owns everything about the grid on the right-hand side: the buffered
 * rows and where they sit in the full result (base offset), the cursor
 * and block-selection anchor, filter and sort, and the scroll window.
 *
 * Rows are requested through a callback that returns the orchestrator
 * Token of the submission. A page is only accepted when its token is the
 * one this state is waiting for, so any page that belongs to an older
 * filter, sort or table is dropped. All methods run on the main loop.
 *
 * A state built without a fetch callback is "static": it shows a fixed
 * RecordSet (the property tabs) and filters it client-side.
 */

#pragma once

#include "../orchestrator.hpp"
#include "../types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sqlnav::ui {

/**
 * What G does when the total row count is not yet known.
 */
enum class EndJumpPolicy {
    Disabled,   // never count; G stops at the last buffered row
    Count,      // exact COUNT(*) after the first page
    Estimate    // engine catalogue estimate after the first page
};

inline const char* end_jump_policy_name(EndJumpPolicy p) {
    switch (p) {
        case EndJumpPolicy::Disabled: return "disabled";
        case EndJumpPolicy::Count:    return "count";
        case EndJumpPolicy::Estimate: return "estimate";
    }
    return "count";
}

inline std::optional<EndJumpPolicy> parse_end_jump_policy(const std::string& s) {
    if (s == "disabled") return EndJumpPolicy::Disabled;
    if (s == "count") return EndJumpPolicy::Count;
    if (s == "estimate") return EndJumpPolicy::Estimate;
    return std::nullopt;
}

struct Position {
    size_t row = 0;
    size_t column = 0;

    bool operator==(const Position& other) const { return row == other.row && column == other.column; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/**
 * Inclusive rectangle of buffer coordinates.
 */
struct Rect {
    size_t top = 0;
    size_t left = 0;
    size_t bottom = 0;
    size_t right = 0;

    bool contains(size_t row, size_t column) const {
        return row >= top && row <= bottom && column >= left && column <= right;
    }
};

struct TableOptions {
    uint64_t page_size = 0;     // 0 = visible rows
    EndJumpPolicy end_jump = EndJumpPolicy::Count;
    size_t max_column_width = 40;
};

class TableState {
public:
    using FetchFn = std::function<Token(const RecordsQuery&)>;
    using CountFn = std::function<Token(const RecordsQuery&, bool estimate)>;

    TableState() = default;

    TableState(FetchFn fetch, CountFn count, TableOptions options = {})
        : fetch_(std::move(fetch)), count_(std::move(count)), options_(options) {}

    explicit TableState(TableOptions options) : options_(options) {}

    // ========================================================================
    // Loading
    // ========================================================================

    /**
     * Show a new table: filter and sort are cleared and page 0 requested.
     */
    void open(const Table& table) {
        table_ = table;
        filter_.clear();
        sort_.reset();
        reset_buffer();
        request_reload();
    }

    /**
     * Re-read from offset 0 under the current filter and sort.
     */
    void reload() {
        if (!table_) return;
        total_.reset();
        total_exact_ = false;
        count_token_ = Token{};
        request_reload();
    }

    /**
     * Replace the contents of a static state.
     */
    void set_rows(RecordSet rows) {
        all_rows_ = std::move(rows);
        apply_static_filter();
    }

    void clear() {
        table_.reset();
        filter_.clear();
        sort_.reset();
        all_rows_ = RecordSet{};
        reset_buffer();
    }

    /**
     * Offer a delivered page. Returns false when the page is not the one
     * being waited for; the state is then untouched.
     */
    bool ingest(const Token& token, const RecordSet& page) {
        if (!pending_ || pending_->token != token) return false;
        if (!(pending_->signature == signature())) {
            pending_.reset();
            return false;
        }
        Pending p = std::move(*pending_);
        pending_.reset();

        const bool short_page = page.size() < p.query.limit;
        switch (p.kind) {
            case PendingKind::Reload:
            case PendingKind::JumpFirst: {
                size_t keep_column = selection_ ? selection_->column : 0;
                buffer_ = page;
                base_ = 0;
                exhausted_ = short_page;
                anchor_.reset();
                scroll_top_ = 0;
                if (p.kind == PendingKind::Reload) {
                    scroll_left_ = 0;
                    selection_ = Position{0, 0};
                } else {
                    selection_ = Position{0, keep_column};
                }
                if (short_page) {
                    total_ = page.size();
                    total_exact_ = true;
                } else if (p.kind == PendingKind::Reload) {
                    request_count();
                }
                break;
            }
            case PendingKind::Append:
                if (buffer_.columns.empty()) buffer_.columns = page.columns;
                buffer_.rows.insert(buffer_.rows.end(), page.rows.begin(), page.rows.end());
                if (short_page) {
                    exhausted_ = true;
                    total_ = base_ + buffer_.size();
                    total_exact_ = true;
                }
                break;
            case PendingKind::Prepend: {
                const size_t added = page.size();
                buffer_.rows.insert(buffer_.rows.begin(), page.rows.begin(), page.rows.end());
                base_ = p.query.offset;
                if (selection_) selection_->row += added;
                if (anchor_) anchor_->row += added;
                scroll_top_ += added;
                break;
            }
            case PendingKind::JumpLast: {
                if (page.empty()) {
                    // The estimate overshot; the end is somewhere before it.
                    total_.reset();
                    total_exact_ = false;
                    request_reload();
                    return true;
                }
                size_t keep_column = selection_ ? selection_->column : 0;
                buffer_ = page;
                base_ = p.query.offset;
                exhausted_ = short_page || (total_exact_ && total_ && base_ + page.size() >= *total_);
                if (short_page) {
                    total_ = base_ + page.size();
                    total_exact_ = true;
                }
                anchor_.reset();
                selection_ = Position{buffer_.size() - 1, keep_column};
                break;
            }
        }
        compute_widths();
        clamp();
        return true;
    }

    bool ingest_count(const Token& token, const RowCount& count) {
        if (!count_token_.valid() || count_token_ != token) return false;
        count_token_ = Token{};
        if (total_exact_ && total_) return true;  // a short page already settled it
        total_ = count.rows;
        total_exact_ = count.rows.has_value() && count.exact;
        return true;
    }

    /**
     * A request failed. Clears the wait if it was ours; rows stay as they
     * are, and a filter or sort that never produced a page is withdrawn.
     */
    bool fail(const Token& token) {
        if (pending_ && pending_->token == token) {
            if (pending_->committed) {
                const Committed& c = *pending_->committed;
                filter_ = c.filter;
                sort_ = c.sort;
                total_ = c.total;
                total_exact_ = c.total_exact;
            }
            pending_.reset();
            return true;
        }
        if (count_token_.valid() && count_token_ == token) {
            count_token_ = Token{};
            return true;
        }
        return false;
    }

    // ========================================================================
    // Navigation
    // ========================================================================

    /**
     * Single-step cursor movement. Collapses any block selection.
     */
    void move(int rows, int columns) {
        anchor_.reset();
        step(rows, columns);
    }

    /**
     * Grow or shrink the block selection anchored where extension began.
     */
    void extend(int rows, int columns) {
        if (!selection_) return;
        if (!anchor_) anchor_ = selection_;
        step(rows, columns);
    }

    void page_down() { move(static_cast<int>(std::max<size_t>(viewport_rows_, 1)), 0); }
    void page_up() { move(-static_cast<int>(std::max<size_t>(viewport_rows_, 1)), 0); }

    /**
     * g: first row. Re-reads the head of the result when it is not buffered.
     */
    void to_top() {
        anchor_.reset();
        if (!selection_) return;
        if (base_ > 0 && !is_static()) {
            submit(PendingKind::JumpFirst, 0, page_size());
            return;
        }
        selection_->row = 0;
        ensure_visible();
    }

    /**
     * G: last buffered row, or the true last page when the total is known
     * and not everything up to it is buffered.
     */
    void to_bottom() {
        anchor_.reset();
        if (!selection_) return;
        const uint64_t buffered_end = base_ + buffer_.size();
        if (!is_static() && !exhausted_ && total_ && *total_ > buffered_end &&
            options_.end_jump != EndJumpPolicy::Disabled) {
            const uint64_t page = page_size();
            const uint64_t offset = *total_ > page ? *total_ - page : 0;
            submit(PendingKind::JumpLast, offset, page);
            return;
        }
        selection_->row = buffer_.size() - 1;
        ensure_visible();
        maybe_prefetch();
    }

    // ========================================================================
    // Filter and Sort
    // ========================================================================

    /**
     * Commit a filter. For a table it is a WHERE fragment pushed to the
     * engine; for a static state it is a case-insensitive substring match.
     */
    void set_filter(const std::string& filter) {
        if (is_static()) {
            filter_ = filter;
            apply_static_filter();
            return;
        }
        const Committed committed = committed_state();
        filter_ = filter;
        reload();
        if (pending_) pending_->committed = committed;
    }

    /**
     * Cycle the sort on the selected column: none, ascending, descending.
     */
    void toggle_sort() {
        if (is_static() || !selection_ || buffer_.columns.empty()) return;
        const Committed committed = committed_state();
        const std::string& column = buffer_.columns[selection_->column];
        if (!sort_ || sort_->column != column) {
            sort_ = SortSpec{column, SortDirection::Ascending};
        } else if (sort_->direction == SortDirection::Ascending) {
            sort_->direction = SortDirection::Descending;
        } else {
            sort_.reset();
        }
        reload();
        if (pending_) pending_->committed = committed;
    }

    // ========================================================================
    // Viewport
    // ========================================================================

    /**
     * Visible data rows and the character width of the grid.
     */
    void set_viewport(size_t rows, size_t width) {
        viewport_rows_ = std::max<size_t>(rows, 1);
        viewport_width_ = width;
        ensure_visible();
    }

    // ========================================================================
    // Read-only View
    // ========================================================================

    const std::optional<Table>& table() const { return table_; }
    const RecordSet& rows() const { return buffer_; }
    const std::vector<std::string>& columns() const { return buffer_.columns; }
    const std::vector<size_t>& column_widths() const { return widths_; }
    const std::string& filter() const { return filter_; }
    const std::optional<SortSpec>& sort() const { return sort_; }

    std::optional<Position> selection() const { return selection_; }
    std::optional<Position> anchor() const { return anchor_; }

    /**
     * The block selection, or the single selected cell.
     */
    std::optional<Rect> selected_rect() const {
        if (!selection_) return std::nullopt;
        const Position a = anchor_ ? *anchor_ : *selection_;
        const Position& b = *selection_;
        return Rect{std::min(a.row, b.row), std::min(a.column, b.column),
                    std::max(a.row, b.row), std::max(a.column, b.column)};
    }

    uint64_t base_offset() const { return base_; }
    std::optional<uint64_t> total() const { return total_; }
    bool total_exact() const { return total_exact_; }
    bool exhausted() const { return exhausted_; }
    bool loading() const { return pending_.has_value(); }
    size_t scroll_top() const { return scroll_top_; }
    size_t scroll_left() const { return scroll_left_; }
    size_t viewport_rows() const { return viewport_rows_; }
    bool is_static() const { return !fetch_; }
    const TableOptions& options() const { return options_; }

    uint64_t page_size() const {
        return options_.page_size > 0 ? options_.page_size : std::max<size_t>(viewport_rows_, 1);
    }

    /**
     * Row number in the full result, counted from 1. 0 with no selection.
     */
    uint64_t absolute_row() const {
        return selection_ ? base_ + selection_->row + 1 : 0;
    }

    /**
     * The selected cell or block as TSV: columns joined by tab, rows by
     * newline, NULL as \N, and backslash, tab and newline escaped.
     */
    std::string copy_payload() const {
        auto rect = selected_rect();
        if (!rect) return {};
        std::string out;
        for (size_t r = rect->top; r <= rect->bottom; ++r) {
            if (r > rect->top) out += '\n';
            for (size_t c = rect->left; c <= rect->right; ++c) {
                if (c > rect->left) out += '\t';
                out += tsv_field(buffer_.rows[r][c]);
            }
        }
        return out;
    }

private:
    enum class PendingKind {
        Reload,
        Append,
        Prepend,
        JumpFirst,
        JumpLast
    };

    struct Signature {
        std::optional<Table> table;
        std::string filter;
        std::optional<SortSpec> sort;

        bool operator==(const Signature& o) const {
            return table == o.table && filter == o.filter && sort == o.sort;
        }
    };

    /**
     * Filter, sort and total that belong to the rows on screen.
     */
    struct Committed {
        std::string filter;
        std::optional<SortSpec> sort;
        std::optional<uint64_t> total;
        bool total_exact = false;
    };

    struct Pending {
        Token token;
        PendingKind kind = PendingKind::Reload;
        RecordsQuery query;
        Signature signature;
        std::optional<Committed> committed;   // restored when this request fails
    };

    FetchFn fetch_;
    CountFn count_;
    TableOptions options_;

    std::optional<Table> table_;
    std::string filter_;
    std::optional<SortSpec> sort_;

    RecordSet buffer_;
    RecordSet all_rows_;    // static mode: rows before filtering
    uint64_t base_ = 0;
    bool exhausted_ = false;
    std::optional<uint64_t> total_;
    bool total_exact_ = false;

    std::optional<Position> selection_;
    std::optional<Position> anchor_;
    std::vector<size_t> widths_;
    size_t scroll_top_ = 0;
    size_t scroll_left_ = 0;
    size_t viewport_rows_ = 20;
    size_t viewport_width_ = 80;

    std::optional<Pending> pending_;
    Token count_token_;

    Signature signature() const { return Signature{table_, filter_, sort_}; }

    Committed committed_state() const {
        if (pending_ && pending_->committed) return *pending_->committed;
        return Committed{filter_, sort_, total_, total_exact_};
    }

    RecordsQuery make_query(uint64_t offset, uint64_t limit) const {
        RecordsQuery q;
        if (table_) q.table = *table_;
        q.offset = offset;
        q.limit = limit;
        q.filter = filter_;
        q.sort = sort_;
        return q;
    }

    void reset_buffer() {
        buffer_ = RecordSet{};
        base_ = 0;
        exhausted_ = false;
        total_.reset();
        total_exact_ = false;
        selection_.reset();
        anchor_.reset();
        widths_.clear();
        scroll_top_ = 0;
        scroll_left_ = 0;
        pending_.reset();
        count_token_ = Token{};
    }

    void submit(PendingKind kind, uint64_t offset, uint64_t limit) {
        if (!fetch_ || !table_) return;
        Pending p;
        if (pending_) p.committed = pending_->committed;
        p.kind = kind;
        p.query = make_query(offset, limit);
        p.signature = signature();
        p.token = fetch_(p.query);
        pending_ = std::move(p);
    }

    void request_reload() {
        submit(PendingKind::Reload, 0, page_size());
    }

    void request_count() {
        if (!count_ || !table_ || count_token_.valid()) return;
        switch (options_.end_jump) {
            case EndJumpPolicy::Disabled:
                return;
            case EndJumpPolicy::Count:
                count_token_ = count_(make_query(0, 0), false);
                return;
            case EndJumpPolicy::Estimate:
                // A catalogue estimate knows nothing about a filter.
                if (!filter_.empty()) return;
                count_token_ = count_(make_query(0, 0), true);
                return;
        }
    }

    /**
     * Fetch the next page once the cursor sits on the last buffered row,
     * or the previous one when it sits on the first and rows were skipped.
     */
    void maybe_prefetch() {
        if (is_static() || !selection_ || pending_) return;
        if (!exhausted_ && selection_->row + 1 >= buffer_.size()) {
            submit(PendingKind::Append, base_ + buffer_.size(), page_size());
        } else if (base_ > 0 && selection_->row == 0) {
            const uint64_t page = page_size();
            const uint64_t offset = base_ > page ? base_ - page : 0;
            submit(PendingKind::Prepend, offset, base_ - offset);
        }
    }

    void step(int rows, int columns) {
        if (!selection_) return;
        Position& s = *selection_;
        const long long max_row = static_cast<long long>(buffer_.size()) - 1;
        const long long max_col = static_cast<long long>(buffer_.columns.size()) - 1;
        long long r = static_cast<long long>(s.row) + rows;
        long long c = static_cast<long long>(s.column) + columns;
        s.row = static_cast<size_t>(std::clamp(r, 0LL, std::max(max_row, 0LL)));
        s.column = static_cast<size_t>(std::clamp(c, 0LL, std::max(max_col, 0LL)));
        ensure_visible();
        if (rows != 0) maybe_prefetch();
    }

    /**
     * Keep selection and anchor inside the buffer.
     */
    void clamp() {
        if (buffer_.empty() || buffer_.columns.empty()) {
            selection_.reset();
            anchor_.reset();
            scroll_top_ = 0;
            scroll_left_ = 0;
            return;
        }
        auto fit = [this](Position& p) {
            p.row = std::min(p.row, buffer_.size() - 1);
            p.column = std::min(p.column, buffer_.columns.size() - 1);
        };
        if (!selection_) selection_ = Position{0, 0};
        fit(*selection_);
        if (anchor_) fit(*anchor_);
        scroll_left_ = std::min(scroll_left_, buffer_.columns.size() - 1);
        ensure_visible();
    }

    void ensure_visible() {
        if (!selection_) return;
        const size_t row = selection_->row;
        if (row < scroll_top_) {
            scroll_top_ = row;
        } else if (row >= scroll_top_ + viewport_rows_) {
            scroll_top_ = row + 1 - viewport_rows_;
        }

        const size_t col = selection_->column;
        if (col < scroll_left_) {
            scroll_left_ = col;
            return;
        }
        while (scroll_left_ < col && span_width(scroll_left_, col) > viewport_width_) {
            ++scroll_left_;
        }
    }

    size_t span_width(size_t from, size_t to) const {
        size_t w = 0;
        for (size_t i = from; i <= to && i < widths_.size(); ++i) {
            w += widths_[i] + 1;
        }
        return w;
    }

    void compute_widths() {
        widths_.assign(buffer_.columns.size(), 1);
        for (size_t i = 0; i < buffer_.columns.size(); ++i) {
            widths_[i] = std::max(widths_[i], display_width(buffer_.columns[i]));
        }
        for (const auto& row : buffer_.rows) {
            for (size_t i = 0; i < row.size() && i < widths_.size(); ++i) {
                widths_[i] = std::max(widths_[i], display_width(row[i].display()));
            }
        }
        if (options_.max_column_width > 0) {
            for (auto& w : widths_) w = std::min(w, options_.max_column_width);
        }
    }

    void apply_static_filter() {
        buffer_.columns = all_rows_.columns;
        buffer_.rows.clear();
        const std::string needle = lower(filter_);
        for (const auto& row : all_rows_.rows) {
            if (needle.empty() || row_matches(row, needle)) {
                buffer_.rows.push_back(row);
            }
        }
        base_ = 0;
        exhausted_ = true;
        total_ = buffer_.size();
        total_exact_ = true;
        anchor_.reset();
        selection_ = Position{0, selection_ ? selection_->column : 0};
        scroll_top_ = 0;
        compute_widths();
        clamp();
    }

    static std::string lower(const std::string& s) {
        std::string out = s;
        for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return out;
    }

    static bool row_matches(const Row& row, const std::string& needle) {
        for (const auto& cell : row.values) {
            if (!cell.is_null() && lower(cell.text).find(needle) != std::string::npos) return true;
        }
        return false;
    }

    static std::string tsv_field(const Cell& cell) {
        if (cell.is_null()) return "\\N";
        std::string out;
        out.reserve(cell.text.size());
        for (char c : cell.text) {
            switch (c) {
                case '\\': out += "\\\\"; break;
                case '\t': out += "\\t"; break;
                case '\n': out += "\\n"; break;
                default:   out += c; break;
            }
        }
        return out;
    }
};

} // namespace sqlnav::ui
