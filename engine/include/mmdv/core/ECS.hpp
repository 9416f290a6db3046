#pragma once
#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <limits>
#include <memory>
#include <tuple>
#include <vector>

namespace mmdv::ecs {

    using Entity = uint32_t;
    constexpr Entity NULL_ENTITY = std::numeric_limits<Entity>::max();

    inline uint32_t nextComponentID() {
        static std::atomic<uint32_t> lastID{0};
        return lastID.fetch_add(1, std::memory_order_relaxed);
    }

    template <typename T>
    inline uint32_t componentTypeID() {
        static const uint32_t typeID = nextComponentID();
        return typeID;
    }

    class ISparseSet {
    public:
        virtual ~ISparseSet() = default;
        virtual void remove(Entity e) = 0;
        virtual bool has(Entity e) const = 0;
        virtual void clear() = 0;
        virtual size_t size() const = 0;
        virtual const std::vector<Entity>& entities() const = 0;
    };

    // Packed component storage: dense[i] belongs to packed[i], sparse maps
    // an entity to its dense index.
    template <typename T>
    class SparseSet : public ISparseSet {
    public:
        template<typename... Args>
        T& emplace(Entity e, Args&&... args) {
            if (e >= m_sparse.size()) {
                m_sparse.resize(e + 1, kInvalid);
            }

            if (m_sparse[e] != kInvalid) {
                m_dense[m_sparse[e]] = T{std::forward<Args>(args)...};
                return m_dense[m_sparse[e]];
            }

            m_sparse[e] = m_dense.size();
            m_packed.push_back(e);
            m_dense.push_back(T{std::forward<Args>(args)...});
            return m_dense.back();
        }

        void remove(Entity e) override {
            if (!has(e)) return;

            const size_t idx = m_sparse[e];
            const size_t last = m_dense.size() - 1;
            const Entity movedEntity = m_packed[last];

            m_dense[idx] = std::move(m_dense[last]);
            m_packed[idx] = movedEntity;
            m_sparse[movedEntity] = idx;
            m_sparse[e] = kInvalid;

            m_dense.pop_back();
            m_packed.pop_back();
        }

        bool has(Entity e) const override {
            return e < m_sparse.size() && m_sparse[e] != kInvalid;
        }

        T& get(Entity e) {
            assert(has(e));
            return m_dense[m_sparse[e]];
        }

        const T& get(Entity e) const {
            assert(has(e));
            return m_dense[m_sparse[e]];
        }

        T* tryGet(Entity e) {
            return has(e) ? &m_dense[m_sparse[e]] : nullptr;
        }

        void clear() override {
            m_dense.clear();
            m_packed.clear();
            std::fill(m_sparse.begin(), m_sparse.end(), kInvalid);
        }

        size_t size() const override { return m_dense.size(); }
        const std::vector<Entity>& entities() const override { return m_packed; }

    private:
        static constexpr size_t kInvalid = std::numeric_limits<size_t>::max();

        std::vector<T> m_dense;
        std::vector<Entity> m_packed;
        std::vector<size_t> m_sparse;
    };

    class Registry {
    public:
        Entity create() {
            if (!m_freeEntities.empty()) {
                Entity e = m_freeEntities.back();
                m_freeEntities.pop_back();
                return e;
            }
            return m_entityCounter++;
        }

        void destroy(Entity e) {
            for (auto& pool : m_pools) {
                if (pool) pool->remove(e);
            }
            m_freeEntities.push_back(e);
        }

        template <typename T>
        SparseSet<T>& pool() {
            const uint32_t typeID = componentTypeID<T>();
            if (typeID >= m_pools.size()) {
                m_pools.resize(typeID + 1);
            }
            if (!m_pools[typeID]) {
                m_pools[typeID] = std::make_unique<SparseSet<T>>();
            }
            return *static_cast<SparseSet<T>*>(m_pools[typeID].get());
        }

        template <typename T, typename... Args>
        T& emplace(Entity e, Args&&... args) {
            return pool<T>().emplace(e, std::forward<Args>(args)...);
        }

        template <typename T>
        void remove(Entity e) {
            pool<T>().remove(e);
        }

        template <typename T>
        bool has(Entity e) const {
            const uint32_t typeID = componentTypeID<T>();
            if (typeID >= m_pools.size() || !m_pools[typeID]) return false;
            return m_pools[typeID]->has(e);
        }

        template <typename T>
        T& get(Entity e) {
            return pool<T>().get(e);
        }

        template <typename T>
        T* tryGet(Entity e) {
            return has<T>(e) ? &pool<T>().get(e) : nullptr;
        }

        template <typename T>
        const T* tryGet(Entity e) const {
            if (!has<T>(e)) return nullptr;
            const uint32_t typeID = componentTypeID<T>();
            return &static_cast<const SparseSet<T>*>(m_pools[typeID].get())->get(e);
        }

        template <typename T>
        size_t count() const {
            const uint32_t typeID = componentTypeID<T>();
            if (typeID >= m_pools.size() || !m_pools[typeID]) return 0;
            return m_pools[typeID]->size();
        }

        // Calls func(entity, components&...) for every entity owning all
        // listed components. The entity list is copied first, so func may
        // add or remove components.
        template <typename First, typename... Rest, typename Func>
        void each(Func&& func) {
            const std::vector<Entity> entities = pool<First>().entities();
            for (Entity e : entities) {
                if (has<First>(e) && (has<Rest>(e) && ...)) {
                    func(e, get<First>(e), get<Rest>(e)...);
                }
            }
        }

        void clear() {
            for (auto& p : m_pools) {
                if (p) p->clear();
            }
            m_entityCounter = 0;
            m_freeEntities.clear();
        }

    private:
        std::vector<std::unique_ptr<ISparseSet>> m_pools;
        std::vector<Entity> m_freeEntities;
        Entity m_entityCounter = 0;
    };
}
