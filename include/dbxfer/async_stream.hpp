// SPDX-License-Identifier: MIT

// include/dbxfer/async_stream.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>

namespace dbxfer {

/// Pull-based lazy sequence.
///
/// The consumer drives the producer by awaiting Next(); nothing is produced
/// ahead of demand.  A stream is single-pass and ends either with
/// std::nullopt or with an exception thrown from Next().  The stream object
/// must outlive every Next() call awaiting on it.
template <typename T>
class AsyncStream {
public:
    virtual ~AsyncStream() = default;

    /// Pull the next item, or std::nullopt at the end of the stream.
    virtual asio::awaitable<std::optional<T>> Next() = 0;
};

template <typename T>
using BoxStream = std::unique_ptr<AsyncStream<T>>;

/// Raw bytes moving through a stream.
using Bytes = std::vector<std::byte>;

namespace detail {

template <typename T>
class VectorStream : public AsyncStream<T> {
public:
    explicit VectorStream(std::vector<T> items) {
        for (auto& item : items) items_.push_back(std::move(item));
    }

    asio::awaitable<std::optional<T>> Next() override {
        if (items_.empty()) co_return std::nullopt;
        std::optional<T> item{std::move(items_.front())};
        items_.pop_front();
        co_return item;
    }

private:
    std::deque<T> items_;
};

template <typename In, typename Out>
class MapStream : public AsyncStream<Out> {
public:
    MapStream(BoxStream<In> input, std::function<Out(In)> fn)
        : input_(std::move(input)), fn_(std::move(fn)) {}

    asio::awaitable<std::optional<Out>> Next() override {
        auto item = co_await input_->Next();
        if (!item) co_return std::nullopt;
        co_return std::optional<Out>{fn_(std::move(*item))};
    }

private:
    BoxStream<In> input_;
    std::function<Out(In)> fn_;
};

}  // namespace detail

/// Stream yielding the elements of @p items in order.
template <typename T>
BoxStream<T> MakeVectorStream(std::vector<T> items) {
    return std::make_unique<detail::VectorStream<T>>(std::move(items));
}

/// Stream yielding exactly one item.
template <typename T>
BoxStream<T> MakeOnceStream(T item) {
    std::vector<T> items;
    items.push_back(std::move(item));
    return MakeVectorStream(std::move(items));
}

/// Stream yielding nothing.
template <typename T>
BoxStream<T> MakeEmptyStream() {
    return MakeVectorStream(std::vector<T>{});
}

/// Lazily apply @p fn to each item of @p input as it is pulled.
template <typename In, typename Out>
BoxStream<Out> MakeMapStream(BoxStream<In> input, std::function<Out(In)> fn) {
    return std::make_unique<detail::MapStream<In, Out>>(std::move(input), std::move(fn));
}

}  // namespace dbxfer
