// worker_pool.cpp
// Thread pool implementation for batch comparison tasks

#include "worker_pool.h"
#include "../lib/log.h"
#include <stdlib.h>
#include <time.h>

#define DEFAULT_THREAD_COUNT 8

static log_category_t* batch_log() { return log_get_category("batch"); }

static double get_time_seconds() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec / 1000000000.0;
}

// Caller holds queue_mutex
static WorkerTask* pop_task(WorkerPool* pool) {
    WorkerTask* task = pool->head;
    if (task) {
        pool->head = task->next;
        if (!pool->head) pool->tail = NULL;
        task->next = NULL;
    }
    return task;
}

static void* worker_thread_func(void* arg) {
    WorkerPool* pool = (WorkerPool*)arg;

    clog_debug(batch_log(), "worker thread %lu started", (unsigned long)pthread_self());

    while (true) {
        pthread_mutex_lock(&pool->queue_mutex);

        while (!pool->head && !pool->shutdown_flag) {
            pthread_cond_wait(&pool->queue_cond, &pool->queue_mutex);
        }

        // drain queued tasks before honouring shutdown
        if (pool->shutdown_flag && !pool->head) {
            pthread_mutex_unlock(&pool->queue_mutex);
            break;
        }

        WorkerTask* task = pop_task(pool);
        pool->active_count++;
        pool->queued_count--;

        pthread_mutex_unlock(&pool->queue_mutex);

        double wait_time = get_time_seconds() - task->enqueue_time;
        clog_debug(batch_log(), "executing task (waited %.3fs) on thread %lu",
                   wait_time, (unsigned long)pthread_self());

        task->task_fn(task->task_data);
        free(task);

        pthread_mutex_lock(&pool->queue_mutex);
        pool->active_count--;
        if (pool->active_count == 0 && !pool->head) {
            pthread_cond_broadcast(&pool->idle_cond);
        }
        pthread_mutex_unlock(&pool->queue_mutex);
    }

    clog_debug(batch_log(), "worker thread %lu exiting", (unsigned long)pthread_self());
    return NULL;
}

WorkerPool* worker_pool_create(int num_threads) {
    if (num_threads <= 0) {
        num_threads = DEFAULT_THREAD_COUNT;
    }

    WorkerPool* pool = (WorkerPool*)calloc(1, sizeof(WorkerPool));
    if (!pool) return NULL;

    pool->num_threads = num_threads;

    if (pthread_mutex_init(&pool->queue_mutex, NULL) != 0) {
        free(pool);
        return NULL;
    }
    if (pthread_cond_init(&pool->queue_cond, NULL) != 0) {
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }
    if (pthread_cond_init(&pool->idle_cond, NULL) != 0) {
        pthread_cond_destroy(&pool->queue_cond);
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }

    pool->threads = (pthread_t*)calloc(num_threads, sizeof(pthread_t));
    if (!pool->threads) {
        pthread_cond_destroy(&pool->idle_cond);
        pthread_cond_destroy(&pool->queue_cond);
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }

    for (int i = 0; i < num_threads; i++) {
        if (pthread_create(&pool->threads[i], NULL, worker_thread_func, pool) != 0) {
            clog_error(batch_log(), "failed to create worker thread %d", i);
            pthread_mutex_lock(&pool->queue_mutex);
            pool->shutdown_flag = true;
            pthread_cond_broadcast(&pool->queue_cond);
            pthread_mutex_unlock(&pool->queue_mutex);

            for (int j = 0; j < i; j++) {
                pthread_join(pool->threads[j], NULL);
            }

            free(pool->threads);
            pthread_cond_destroy(&pool->idle_cond);
            pthread_cond_destroy(&pool->queue_cond);
            pthread_mutex_destroy(&pool->queue_mutex);
            free(pool);
            return NULL;
        }
    }

    clog_debug(batch_log(), "created worker pool with %d workers", num_threads);
    return pool;
}

void worker_pool_destroy(WorkerPool* pool) {
    if (!pool) return;

    worker_pool_shutdown(pool);

    for (int i = 0; i < pool->num_threads; i++) {
        pthread_join(pool->threads[i], NULL);
    }

    // workers drain the queue before exiting, so nothing is left to free
    free(pool->threads);
    pthread_cond_destroy(&pool->idle_cond);
    pthread_cond_destroy(&pool->queue_cond);
    pthread_mutex_destroy(&pool->queue_mutex);
    free(pool);

    clog_debug(batch_log(), "worker pool destroyed");
}

bool worker_pool_enqueue(WorkerPool* pool, WorkerTaskFunction task_fn, void* task_data) {
    if (!pool || !task_fn) return false;

    WorkerTask* task = (WorkerTask*)malloc(sizeof(WorkerTask));
    if (!task) {
        clog_error(batch_log(), "failed to allocate worker task");
        return false;
    }
    task->task_fn = task_fn;
    task->task_data = task_data;
    task->enqueue_time = get_time_seconds();
    task->next = NULL;

    pthread_mutex_lock(&pool->queue_mutex);

    if (pool->shutdown_flag) {
        pthread_mutex_unlock(&pool->queue_mutex);
        free(task);
        clog_error(batch_log(), "enqueue rejected: pool is shutting down");
        return false;
    }

    if (pool->tail) {
        pool->tail->next = task;
    } else {
        pool->head = task;
    }
    pool->tail = task;
    pool->queued_count++;
    int queued = pool->queued_count;
    pthread_cond_signal(&pool->queue_cond);

    pthread_mutex_unlock(&pool->queue_mutex);

    clog_debug(batch_log(), "enqueued task (%d tasks queued)", queued);
    return true;
}

void worker_pool_wait_all(WorkerPool* pool) {
    if (!pool) return;

    pthread_mutex_lock(&pool->queue_mutex);
    while (pool->active_count > 0 || pool->head) {
        pthread_cond_wait(&pool->idle_cond, &pool->queue_mutex);
    }
    pthread_mutex_unlock(&pool->queue_mutex);

    clog_debug(batch_log(), "all tasks completed");
}

// Stop accepting new tasks; queued tasks still run
void worker_pool_shutdown(WorkerPool* pool) {
    if (!pool) return;

    pthread_mutex_lock(&pool->queue_mutex);
    pool->shutdown_flag = true;
    pthread_cond_broadcast(&pool->queue_cond);
    pthread_mutex_unlock(&pool->queue_mutex);
}

int worker_pool_get_active_count(WorkerPool* pool) {
    if (!pool) return 0;
    pthread_mutex_lock(&pool->queue_mutex);
    int count = pool->active_count;
    pthread_mutex_unlock(&pool->queue_mutex);
    return count;
}

int worker_pool_get_queued_count(WorkerPool* pool) {
    if (!pool) return 0;
    pthread_mutex_lock(&pool->queue_mutex);
    int count = pool->queued_count;
    pthread_mutex_unlock(&pool->queue_mutex);
    return count;
}
