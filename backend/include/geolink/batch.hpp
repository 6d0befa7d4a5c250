#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <iostream>
#include <vector>

namespace geolink
{

class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Runs fn(item, index) for every item, at most max_parallel at a time.
// Stops scheduling new windows once the token is cancelled; returns the
// number of items that were scheduled. Exceptions escaping fn are logged
// and do not stop the batch.
template <typename Item, typename Fn>
std::size_t run_batch(const std::vector<Item> &items, std::size_t max_parallel, const CancellationToken *cancel, Fn fn)
{
    const std::size_t window = std::max<std::size_t>(1, max_parallel);
    std::size_t scheduled = 0;

    for (std::size_t begin = 0; begin < items.size(); begin += window)
    {
        if (cancel && cancel->is_cancelled())
        {
            std::cout << "Batch cancelled after " << scheduled << " of " << items.size() << " items." << std::endl;
            break;
        }

        const std::size_t end = std::min(items.size(), begin + window);
        std::vector<std::future<void>> futures;
        futures.reserve(end - begin);

        for (std::size_t i = begin; i < end; i++)
        {
            futures.push_back(std::async(std::launch::async, [&fn, &items, i]()
                                         { fn(items[i], i); }));
            scheduled++;
        }

        for (auto &future : futures)
        {
            try
            {
                future.get();
            }
            catch (const std::exception &ex)
            {
                std::cerr << "Batch item failed: " << ex.what() << std::endl;
            }
        }
    }

    return scheduled;
}

} // namespace geolink
