#include "ScanQueue.h"

void ScanQueue::Push(std::string path)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mQueue.push(std::move(path));
    mCond.notify_one();
}

bool ScanQueue::Pop(std::string& outPath)
{
    std::unique_lock<std::mutex> lock(mMutex);
    mCond.wait(lock, [&]() {
        return !mQueue.empty() || mbClosed;
    });

    if (mQueue.empty())
    {
        return false;
    }

    outPath = std::move(mQueue.front());
    mQueue.pop();
    return true;
}

void ScanQueue::Close()
{
    std::lock_guard<std::mutex> lock(mMutex);
    mbClosed = true;
    mCond.notify_all();
}

void ScanQueue::Cancel()
{
    std::lock_guard<std::mutex> lock(mMutex);
    std::queue<std::string>().swap(mQueue);
    mbClosed = true;
    mCond.notify_all();
}
