// worker_pool.h
// Fixed-size thread pool running comparison tasks in FIFO order

#ifndef XMLCOMPARE_WORKER_POOL_H
#define XMLCOMPARE_WORKER_POOL_H

#include <pthread.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// Task function signature
typedef void (*WorkerTaskFunction)(void* task_data);

// Queued task (singly linked FIFO)
typedef struct WorkerTask {
    WorkerTaskFunction task_fn;  // Task function to execute
    void* task_data;             // Argument passed to task_fn
    double enqueue_time;         // When task was queued
    struct WorkerTask* next;
} WorkerTask;

// Thread pool structure
typedef struct WorkerPool {
    int num_threads;             // Number of worker threads
    pthread_t* threads;          // Worker thread handles

    WorkerTask* head;            // Next task to run
    WorkerTask* tail;            // Last queued task
    pthread_mutex_t queue_mutex; // Protects queue and counters
    pthread_cond_t queue_cond;   // Signals new tasks
    pthread_cond_t idle_cond;    // Signals queue empty and no active worker

    bool shutdown_flag;          // Shutdown requested
    int active_count;            // Number of workers running a task
    int queued_count;            // Number of queued tasks
} WorkerPool;

// Create and destroy pool; num_threads <= 0 selects the default (8)
WorkerPool* worker_pool_create(int num_threads);
void worker_pool_destroy(WorkerPool* pool);

// Task management
bool worker_pool_enqueue(WorkerPool* pool, WorkerTaskFunction task_fn, void* task_data);
void worker_pool_wait_all(WorkerPool* pool);
void worker_pool_shutdown(WorkerPool* pool);

// Statistics
int worker_pool_get_active_count(WorkerPool* pool);
int worker_pool_get_queued_count(WorkerPool* pool);

#ifdef __cplusplus
}
#endif

#endif // XMLCOMPARE_WORKER_POOL_H
