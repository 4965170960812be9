#ifndef HASHMAP_HPP
#define HASHMAP_HPP

#include <vector>
#include <string>
#include <functional>
#include <utility>

// Элемент хеш-таблицы (пара Ключ-Значение)
template <typename K, typename V>
struct HashNode
{
    K key;
    V value;
    HashNode(K k, V v) : key(std::move(k)), value(std::move(v)) {}
};

template <typename K, typename V>
class HashMap
{
private:
    // Метод цепочек: каждая корзина хранит свою цепочку узлов
    std::vector<std::vector<HashNode<K, V>>> buckets;
    size_t tableSize;
    size_t elementCount;
    float maxLoadFactor = 0.75f;

    size_t hashFunction(const K &key) const
    {
        return std::hash<K>{}(key) % tableSize;
    }

    void rehash()
    {
        size_t oldSize = tableSize;
        tableSize *= 2;
        auto oldBuckets = std::move(buckets);

        buckets.assign(tableSize, std::vector<HashNode<K, V>>());
        elementCount = 0;

        for (size_t i = 0; i < oldSize; ++i)
        {
            for (auto &node : oldBuckets[i])
            {
                insert(node.key, node.value);
            }
        }
    }

public:
    explicit HashMap(size_t initialSize = 1009) : tableSize(initialSize == 0 ? 1 : initialSize), elementCount(0)
    {
        buckets.resize(tableSize);
    }

    void insert(const K &key, const V &value)
    {
        if ((float)elementCount / tableSize > maxLoadFactor)
        {
            rehash();
        }

        size_t index = hashFunction(key);
        for (auto &node : buckets[index])
        {
            if (node.key == key)
            {
                node.value = value;
                return;
            }
        }

        buckets[index].emplace_back(key, value);
        elementCount++;
    }

    // Возвращает указатель на значение, или nullptr если не найдено
    V *get(const K &key)
    {
        size_t index = hashFunction(key);
        for (auto &node : buckets[index])
        {
            if (node.key == key)
            {
                return &node.value;
            }
        }
        return nullptr;
    }

    const V *get(const K &key) const
    {
        size_t index = hashFunction(key);
        for (const auto &node : buckets[index])
        {
            if (node.key == key)
            {
                return &node.value;
            }
        }
        return nullptr;
    }

    // Значение по ключу или fallback, если ключа нет
    V getOr(const K &key, const V &fallback) const
    {
        const V *value = get(key);
        return value ? *value : fallback;
    }

    bool contains(const K &key) const
    {
        return get(key) != nullptr;
    }

    size_t size() const { return elementCount; }
    bool empty() const { return elementCount == 0; }

    void traverse(std::function<void(const K &key, const V &value)> callback) const
    {
        for (const auto &bucket : buckets)
        {
            for (const auto &node : bucket)
            {
                callback(node.key, node.value);
            }
        }
    }

    void clear()
    {
        for (auto &bucket : buckets)
        {
            bucket.clear();
        }
        elementCount = 0;
    }
};

#endif
