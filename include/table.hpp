#ifndef __TETHER_TABLE_HPP
#define __TETHER_TABLE_HPP

#include "base.hpp"

namespace tether {

static const float REHASH_THRESHOLD = 0.3;

/// hash table using linear probing. Keys need a hash<K> specialization.
template <typename K, typename T> class table {
private:
    // hash table entry
    struct entry {
        const K key;
        T val;

        entry(const K& k, const T& v) : key{k}, val{v} { }
    };

    u32 cap;
    u32 threshold;
    u32 size;
    entry **array;

    // increase the capacity by a factor of 2. this involves recomputing all hashes
    void increase_cap() {
        auto *prev = array;
        auto old_cap = cap;

        cap *= 2;
        threshold = (u32)(REHASH_THRESHOLD * cap);
        size = 0;
        array = new entry*[cap];
        for (u32 i = 0; i < cap; ++i) {
            array[i] = nullptr;
        }

        for (u32 i = 0; i < old_cap; ++i) {
            if (prev[i] != nullptr) {
                insert(prev[i]->key, prev[i]->val);
                delete prev[i];
            }
        }
        delete[] prev;
    }

    // index of the slot holding k, or of the empty slot ending its probe
    // sequence. The threshold guarantees an empty slot exists.
    u32 find_slot(const K& k) const {
        u32 i = hash<K>(k) % cap;
        while (array[i] != nullptr && !(array[i]->key == k)) {
            i = (i+1) % cap;
        }
        return i;
    }

    void clear_array() {
        for (u32 i = 0; i < cap; ++i) {
            if (array[i] != nullptr) {
                delete array[i];
            }
        }
        delete[] array;
    }

    void copy_array(const table<K,T>& src) {
        array = new entry*[cap];
        for (u32 i = 0; i < cap; ++i) {
            if (src.array[i] != nullptr) {
                array[i] = new entry{src.array[i]->key, src.array[i]->val};
            } else {
                array[i] = nullptr;
            }
        }
    }

public:
    table(u32 init_cap=32)
        : cap{init_cap} {
        threshold = (u32)(REHASH_THRESHOLD * (float)init_cap);
        size = 0;
        array = new entry*[init_cap];
        for (u32 i = 0; i < init_cap; ++i) {
            array[i] = nullptr;
        }
    }
    table(const table<K,T>& src)
        : cap{src.cap}
        , threshold{src.threshold}
        , size{src.size} {
        copy_array(src);
    }
    ~table() {
        clear_array();
    }

    table<K,T>& operator=(const table<K,T>& src) {
        if (this == &src) {
            return *this;
        }
        clear_array();
        cap = src.cap;
        threshold = src.threshold;
        size = src.size;
        copy_array(src);
        return *this;
    }

    u32 get_size() const {
        return size;
    }

    // insert/overwrite an entry
    T& insert(const K& k, T v) {
        if (size >= threshold) {
            increase_cap();
        }
        auto i = find_slot(k);
        if (array[i] == nullptr) {
            ++size;
            array[i] = new entry{k, v};
        } else {
            array[i]->val = v;
        }
        return array[i]->val;
    }

    // returns std::nullopt when no object is associated to the key
    optional<T> get(const K& k) const {
        auto i = find_slot(k);
        if (array[i] == nullptr) {
            return std::nullopt;
        }
        return array[i]->val;
    }

    // pointer to the stored value, or nullptr. Invalidated by insert/remove.
    T* get_ptr(const K& k) {
        auto i = find_slot(k);
        return array[i] == nullptr ? nullptr : &array[i]->val;
    }

    bool has_key(const K& k) const {
        return array[find_slot(k)] != nullptr;
    }

    // remove the entry for k. Returns false if there was none. Entries later
    // in the same probe run are shifted back so lookups stay correct.
    bool remove(const K& k) {
        auto i = find_slot(k);
        if (array[i] == nullptr) {
            return false;
        }
        delete array[i];
        array[i] = nullptr;
        --size;

        auto j = (i+1) % cap;
        while (array[j] != nullptr) {
            auto e = array[j];
            array[j] = nullptr;
            array[find_slot(e->key)] = e;
            j = (j+1) % cap;
        }
        return true;
    }

    const forward_list<K> keys() const {
        forward_list<K> res;
        for (u32 i = 0; i < cap; ++i) {
            if (array[i] != nullptr) {
                res.push_front(array[i]->key);
            }
        }
        return res;
    }

};

}

#endif
