/*───────────────────────────────────────────────────────────
 *  trip_loader.hpp   –  CSV → TripRecord
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "trip_record.hpp"

namespace taxi_fare {

/*  Streams trips out of a header-having, comma separated file.
 *  The header is consumed by the constructor; rows are parsed one
 *  at a time by next().  Any malformed row throws std::runtime_error
 *  naming the file and the 1-based line.  To read the file again,
 *  construct a new reader.                                          */
class TripReader {
public:
    /* single-pass input iterator; begin() pulls the first row */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = TripRecord;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const TripRecord*;
        using reference         = const TripRecord&;

        iterator() = default;
        explicit iterator(TripReader* reader) : reader_(reader) { ++*this; }

        reference operator*() const { return cur_; }
        pointer operator->() const { return &cur_; }

        iterator& operator++() {
            if (reader_ && !reader_->next(cur_)) reader_ = nullptr;
            return *this;
        }
        iterator operator++(int) { iterator old = *this; ++*this; return old; }

        bool operator==(const iterator& o) const { return reader_ == o.reader_; }
        bool operator!=(const iterator& o) const { return reader_ != o.reader_; }

    private:
        TripReader* reader_ = nullptr;
        TripRecord  cur_;
    };

    explicit TripReader(const std::string& path);

    TripReader(const TripReader&)            = delete;
    TripReader& operator=(const TripReader&) = delete;

    /* false at end of file */
    bool next(TripRecord& out);

    const std::string& path() const { return path_; }
    size_t line_no() const { return line_no_; }
    size_t rows_read() const { return rows_; }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::string   path_;
    std::ifstream in_;
    size_t        line_no_ = 0;
    size_t        rows_    = 0;
};

/* parse one data line; `where` prefixes the error message */
TripRecord parse_trip_line(const std::string& line, const std::string& where);

/* drain a TripReader */
std::vector<TripRecord> load_trips(const std::string& path);

} // namespace taxi_fare
