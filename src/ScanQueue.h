#pragma once
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

// 워커 스레드에 검사할 경로를 나눠주는 작업 큐
class ScanQueue
{
public:
    ScanQueue() = default;
    ScanQueue(const ScanQueue&) = delete;
    ScanQueue& operator=(const ScanQueue&) = delete;

    void Push(std::string path);
    bool Pop(std::string& outPath);

    // 더 이상 작업이 추가되지 않음 (남은 작업은 계속 꺼낼 수 있음)
    void Close();

    // 남은 작업을 버리고 대기 중인 워커를 깨움
    void Cancel();

private:
    std::queue<std::string> mQueue;
    std::mutex mMutex;
    std::condition_variable mCond;
    bool mbClosed = false;
};
