/** @file cookie_cache.hpp **/

#pragma once

#include "compression/error.hpp"
#include <list>
#include <map>
#include <optional>
#include <utility>
#include <cstdint>

namespace gzio {
    /**
       @class cookie_cache gzio/cookie_cache.hpp

       @brief bounded map from stream position to seek checkpoint.

       Ordered by key,  so callers can also ask for the nearest checkpoint
       at-or-before a position (@ref floor).
       Holds at most @ref capacity entries;  inserting past capacity evicts
       the least-recently-used entry.  Lookups through @ref find and
       @ref floor count as use.

       @tparam Key    stream position type
       @tparam Value  checkpoint type (copyable)
    **/
    template <typename Key, typename Value>
    class cookie_cache {
    public:
        using key_type = Key;
        using mapped_type = Value;
        using size_type = std::size_t;

    public:
        explicit cookie_cache(size_type capacity) : capacity_{capacity} {
            if (capacity == 0)
                throw invalid_argument("cookie_cache: capacity must be positive");
        }

        size_type capacity() const { return capacity_; }
        size_type size() const { return map_.size(); }
        bool empty() const { return map_.empty(); }
        /** @brief number of entries evicted since construction **/
        std::uint64_t n_evicted() const { return n_evicted_; }

        bool contains(Key const & k) const { return map_.find(k) != map_.end(); }

        /** @brief insert or replace entry for @p k,  making it most recently used **/
        void insert(Key const & k, Value v) {
            auto ix = map_.find(k);

            if (ix != map_.end()) {
                ix->second.value = std::move(v);
                this->touch(ix);
                return;
            }

            lru_.push_front(k);
            map_.emplace(k, entry{std::move(v), lru_.begin()});

            while (map_.size() > capacity_)
                this->evict_one();
        }

        /** @brief insert entry for @p k unless one is already present **/
        void insert_if_absent(Key const & k, Value v) {
            if (!this->contains(k))
                this->insert(k, std::move(v));
        }

        /** @brief checkpoint recorded for exactly @p k,  or nullptr **/
        Value const * find(Key const & k) {
            auto ix = map_.find(k);

            if (ix == map_.end())
                return nullptr;

            this->touch(ix);

            return &(ix->second.value);
        }

        /** @brief entry with the greatest key <= @p k **/
        std::optional<std::pair<Key, Value>> floor(Key const & k) {
            auto ix = map_.upper_bound(k);

            if (ix == map_.begin())
                return std::nullopt;

            --ix;
            this->touch(ix);

            return std::make_pair(ix->first, ix->second.value);
        }

        void clear() {
            map_.clear();
            lru_.clear();
        }

    private:
        struct entry {
            Value value;
            /** @brief position of this entry's key in @ref lru_ **/
            typename std::list<Key>::iterator lru_ix;
        };

        using map_type = std::map<Key, entry>;

        void touch(typename map_type::iterator ix) {
            lru_.splice(lru_.begin(), lru_, ix->second.lru_ix);
        }

        void evict_one() {
            map_.erase(lru_.back());
            lru_.pop_back();
            ++n_evicted_;
        }

    private:
        size_type capacity_ = 0;
        map_type map_;
        /** @brief keys,  most recently used first **/
        std::list<Key> lru_;
        std::uint64_t n_evicted_ = 0;
    };
} /*namespace gzio*/
