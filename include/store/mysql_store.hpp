#pragma once

#include <mutex>
#include <ormpp/dbng.hpp>
#include <ormpp/mysql.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "store/store.hpp"

namespace arena::store {

/**
 * @brief 表示一个 MySQL 连接，由多个持久化存储共享
 * 连接断开时在下一次操作前自动重连，所有操作都在锁内串行执行。
 */
class mysql_conn {
public:
    explicit mysql_conn(const database_config &config);

    /**
     * @brief 创建表，如果已经存在则不做任何事
     */
    void init_schema();

    /**
     * @brief 在 callback 内完成数据库操作
     * ormpp 抛出的异常会被转换为 database_error
     */
    template <typename Func>
    auto execute(Func &&callback) {
        std::lock_guard<std::mutex> guard(mut);
        try {
            if (!db.ping()) connect();
            return callback(db);
        } catch (std::runtime_error &e) {
            BOOST_THROW_EXCEPTION(database_error(std::string("MySQL: ") + e.what()));
        }
    }

private:
    void connect();

    database_config config;
    std::mutex mut;
    ormpp::dbng<ormpp::mysql> db;
};

/**
 * @brief 以 MySQL 表 room_state 为持久化存储的房间存储
 * 每个房间一行，payload 列保存 JSON，只接受版本号更大的写入。
 */
class mysql_room_store : public room_store {
public:
    explicit mysql_room_store(mysql_conn &conn);

    std::optional<battle::room_state> load(const std::string &room_id) override;
    bool store(const battle::room_state &state) override;
    bool restore(const battle::room_state &state) override;
    std::optional<std::string> find_by_code(const std::string &code) override;
    void remove(const std::string &room_id) override;
    std::vector<battle::room_state> load_unfinished() override;

private:
    mysql_conn &conn;
};

class mysql_submission_store : public submission_store {
public:
    explicit mysql_submission_store(mysql_conn &conn);

    void add(const submission_record &record) override;
    std::vector<submission_record> list_by_room(const std::string &room_id) override;

private:
    mysql_conn &conn;
};

class mysql_leaderboard_store : public leaderboard_store {
public:
    explicit mysql_leaderboard_store(mysql_conn &conn);

    bool offer(const leaderboard_entry &entry) override;
    std::vector<leaderboard_entry> list(const std::string &category, size_t limit) override;

private:
    mysql_conn &conn;
};

}  // namespace arena::store
