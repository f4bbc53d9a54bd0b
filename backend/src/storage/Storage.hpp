#pragma once
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>
#include "JsonCodec.hpp"
#include "../core/Card.hpp"

// Storage owns the whole flashcard store: cards, the append-only review log and
// due-date markers, persisted as one JSON document.
//
// Every public call takes the single reader/writer lock: reads share it, writes
// and save() hold it exclusively. Mutations only change memory; nothing reaches
// disk until save() (or a persisting transact()) runs. Errors are thrown as
// NotFoundError / StorageError.
//
// save() writes "<file>.tmp" and renames it over the target, so a crash during the
// write leaves the previous file intact.
class Storage {
public:
    explicit Storage(const std::string& filename);

    const std::string& path() const { return filename; }

    // CARDS
    Card createCard(const std::string& front, const std::string& back,
        const std::vector<std::string>& tags, Timestamp now = Clock::now());
    Card getCard(const std::string& id) const;
    void updateCard(const Card& card);
    void deleteCard(const std::string& id);
    // OR filter: cards carrying any of `tags`; all cards when empty. Ordered by id.
    std::vector<Card> listCards(const std::vector<std::string>& tags) const;

    // REVIEWS (append-only; reviews of deleted cards stay in the log)
    Review addReview(Review review);
    std::vector<Review> getCardReviews(const std::string& cardId) const;

    // DUE DATES
    DueDate addDueDate(DueDate dueDate);
    std::vector<DueDate> listDueDates() const;
    void updateDueDate(const DueDate& dueDate);
    void deleteDueDate(const std::string& id);

    // Consistent copy of everything, taken under one shared lock
    StoreData snapshot() const;

    // Runs fn(StoreData&) under exclusive access. With persist set the store is
    // written before the lock is released, so fn plus the save form one critical
    // section. If fn throws nothing is written.
    template <typename Fn>
    auto transact(Fn&& fn, bool persist) {
        std::unique_lock<std::shared_mutex> lock(mutex);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, StoreData&>>) {
            fn(data);
            data.last_updated = Clock::now();
            if (persist) writeFile();
        }
        else {
            auto result = fn(data);
            data.last_updated = Clock::now();
            if (persist) writeFile();
            return result;
        }
    }

    // FILE
    void load();
    void save();

private:
    // Caller must hold the exclusive lock.
    void writeFile();

    std::string filename;
    StoreData data;
    mutable std::shared_mutex mutex;
};
