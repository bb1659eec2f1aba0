#include "KinematicWorld.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace edgesim
{
    namespace
    {
        constexpr double RAD_TO_DEG = 57.29577951308232;

        double planarDistance(const Vec3 &a, const Vec3 &b)
        {
            return std::hypot(b.x - a.x, b.y - a.y);
        }

        Vec3 planarDirection(const Vec3 &from, const Vec3 &to)
        {
            const double d = planarDistance(from, to);
            if (d <= 0.0)
            {
                return Vec3{};
            }
            return Vec3{(to.x - from.x) / d, (to.y - from.y) / d, 0.0};
        }
    }

    KinematicWorld::KinematicWorld(KinematicWorldOptions options)
        : options(options)
    {
        if (this->options.fps <= 0.0)
        {
            this->options.fps = 10.0;
        }
    }

    bool KinematicWorld::spawnVehicle(const std::string &actor_id,
                                      const Vec3 &location,
                                      std::vector<Vec3> path,
                                      double cruise_speed,
                                      std::string *error)
    {
        if (actor_index.count(actor_id) > 0)
        {
            if (error)
                *error = "actor id already in use: " + actor_id;
            return false;
        }
        if (cruise_speed < 0.0)
        {
            if (error)
                *error = "cruise speed must not be negative";
            return false;
        }

        Actor actor;
        actor.id = actor_id;
        actor.mobile = true;
        actor.location = location;
        actor.cruise_speed = cruise_speed;
        actor.path = std::move(path);
        // The spawn point itself may open the path.
        while (actor.next_waypoint < actor.path.size() &&
               planarDistance(actor.location, actor.path[actor.next_waypoint]) <= 0.0)
        {
            actor.next_waypoint++;
        }
        if (actor.next_waypoint < actor.path.size())
        {
            actor.direction = planarDirection(actor.location, actor.path[actor.next_waypoint]);
            actor.heading = std::atan2(actor.direction.y, actor.direction.x) * RAD_TO_DEG;
        }

        actor_index[actor_id] = actors.size();
        actors.push_back(std::move(actor));
        return true;
    }

    bool KinematicWorld::spawnStatic(const std::string &actor_id, const Vec3 &location, double heading, std::string *error)
    {
        if (actor_index.count(actor_id) > 0)
        {
            if (error)
                *error = "actor id already in use: " + actor_id;
            return false;
        }

        Actor actor;
        actor.id = actor_id;
        actor.location = location;
        actor.heading = heading;
        actor_index[actor_id] = actors.size();
        actors.push_back(std::move(actor));
        return true;
    }

    bool KinematicWorld::spawnCamera(const std::string &sensor_id, const std::optional<std::string> &parent_id, std::string *error)
    {
        if (parent_id.has_value() && !findActor(*parent_id))
        {
            if (error)
                *error = "camera parent does not exist: " + *parent_id;
            return false;
        }
        for (const auto &camera : cameras)
        {
            if (camera.id == sensor_id)
            {
                if (error)
                    *error = "sensor id already in use: " + sensor_id;
                return false;
            }
        }

        Camera camera;
        camera.id = sensor_id;
        camera.parent_id = parent_id;
        cameras.push_back(camera);
        return true;
    }

    void KinematicWorld::addSignal(const Vec3 &location)
    {
        signals.push_back(Signal{location, SignalController(options.signal_timing)});
    }

    void KinematicWorld::setCameraEnabled(const std::string &sensor_id, bool enabled)
    {
        for (auto &camera : cameras)
        {
            if (camera.id == sensor_id)
            {
                camera.enabled = enabled;
            }
        }
    }

    std::size_t KinematicWorld::getLiveActorCount() const
    {
        auto live_actors = std::count_if(actors.begin(), actors.end(), [](const Actor &a)
                                         { return !a.released; });
        auto live_cameras = std::count_if(cameras.begin(), cameras.end(), [](const Camera &c)
                                          { return !c.released; });
        return static_cast<std::size_t>(live_actors + live_cameras);
    }

    const KinematicWorld::Actor *KinematicWorld::findActor(const std::string &actor_id) const
    {
        auto it = actor_index.find(actor_id);
        return it == actor_index.end() ? nullptr : &actors[it->second];
    }

    std::optional<EntityState> KinematicWorld::entityPoseVelocity(const std::string &entity_id) const
    {
        const Actor *actor = findActor(entity_id);
        if (!actor || actor->released)
        {
            return std::nullopt;
        }

        EntityState state;
        state.id = actor->id;
        state.tick = tick;
        state.location = actor->location;
        state.velocity = Vec3{actor->direction.x * actor->speed, actor->direction.y * actor->speed, 0.0};
        state.heading = actor->heading;
        return state;
    }

    std::optional<CameraFrame> KinematicWorld::cameraFrame(const std::string &sensor_id) const
    {
        auto it = std::find_if(cameras.begin(), cameras.end(), [&](const Camera &camera)
                               { return camera.id == sensor_id; });
        if (it == cameras.end() || !it->enabled || it->released)
        {
            return std::nullopt;
        }
        if (it->parent_id.has_value())
        {
            const Actor *parent = findActor(*it->parent_id);
            if (!parent || parent->released)
            {
                return std::nullopt;
            }
        }

        CameraFrame frame;
        frame.sensor_id = sensor_id;
        frame.tick = tick;
        frame.width = options.img_width;
        frame.height = options.img_height;
        return frame;
    }

    const KinematicWorld::Signal *KinematicWorld::governingSignal(const Actor &actor) const
    {
        const Signal *nearest = nullptr;
        double nearest_distance = options.signal_radius;
        for (const auto &signal : signals)
        {
            double d = planarDistance(actor.location, signal.location);
            if (d < nearest_distance)
            {
                nearest = &signal;
                nearest_distance = d;
            }
        }
        return nearest;
    }

    SignalAxis KinematicWorld::axisOf(const Actor &actor) const
    {
        double dx = actor.direction.x;
        double dy = actor.direction.y;
        if (dx == 0.0 && dy == 0.0)
        {
            dx = std::cos(actor.heading / RAD_TO_DEG);
            dy = std::sin(actor.heading / RAD_TO_DEG);
        }
        return std::abs(dx) >= std::abs(dy) ? SignalAxis::EastWest : SignalAxis::NorthSouth;
    }

    LightState KinematicWorld::trafficSignalState(const std::string &entity_id) const
    {
        const Actor *actor = findActor(entity_id);
        if (!actor || !actor->mobile)
        {
            return LightState::Green;
        }
        const Signal *signal = governingSignal(*actor);
        if (!signal)
        {
            return LightState::Green;
        }
        return signal->controller.getState(axisOf(*actor));
    }

    bool KinematicWorld::shouldHold(const Actor &actor) const
    {
        const Signal *signal = governingSignal(actor);
        if (!signal || signal->controller.getState(axisOf(actor)) == LightState::Green)
        {
            return false;
        }

        const double d = planarDistance(actor.location, signal->location);
        if (d < options.box_half_width || d > options.stop_distance)
        {
            return false;
        }

        const double towards = actor.direction.x * (signal->location.x - actor.location.x) +
                               actor.direction.y * (signal->location.y - actor.location.y);
        return towards > 0.0;
    }

    void KinematicWorld::updateSpeed(Actor &actor, double target_speed, double dt_seconds) const
    {
        target_speed = std::max(0.0, target_speed);

        double delta = target_speed - actor.speed;
        double max_change = options.acceleration * dt_seconds;

        if (std::abs(delta) <= max_change)
            actor.speed = target_speed;
        else if (delta > 0.0)
            actor.speed += max_change;
        else
            actor.speed -= max_change;
    }

    void KinematicWorld::stepVehicle(Actor &actor, double dt_seconds)
    {
        if (actor.next_waypoint >= actor.path.size())
        {
            actor.speed = 0.0;
            return;
        }

        updateSpeed(actor, shouldHold(actor) ? 0.0 : actor.cruise_speed, dt_seconds);

        double step = actor.speed * dt_seconds;
        while (step > 0.0 && actor.next_waypoint < actor.path.size())
        {
            const Vec3 &waypoint = actor.path[actor.next_waypoint];
            const double remaining = planarDistance(actor.location, waypoint);
            if (remaining <= step)
            {
                actor.location = waypoint;
                step -= remaining;
                actor.next_waypoint++;
                if (actor.next_waypoint < actor.path.size())
                {
                    actor.direction = planarDirection(actor.location, actor.path[actor.next_waypoint]);
                }
                continue;
            }

            actor.direction = planarDirection(actor.location, waypoint);
            actor.location.x += actor.direction.x * step;
            actor.location.y += actor.direction.y * step;
            step = 0.0;
        }

        if (actor.next_waypoint >= actor.path.size())
        {
            // Parked on the destination waypoint.
            actor.speed = 0.0;
        }
        if (actor.direction.x != 0.0 || actor.direction.y != 0.0)
        {
            actor.heading = std::atan2(actor.direction.y, actor.direction.x) * RAD_TO_DEG;
        }
    }

    void KinematicWorld::advanceOneTick()
    {
        const double dt = 1.0 / options.fps;
        for (auto &signal : signals)
        {
            signal.controller.tick(dt);
        }
        for (auto &actor : actors)
        {
            if (actor.mobile && !actor.released)
            {
                stepVehicle(actor, dt);
            }
        }
        tick++;
    }

    bool KinematicWorld::releaseActor(const std::string &actor_id, std::string *error)
    {
        for (auto &camera : cameras)
        {
            if (camera.id != actor_id)
            {
                continue;
            }
            if (camera.released)
            {
                if (error)
                    *error = "sensor already released: " + actor_id;
                return false;
            }
            camera.released = true;
            return true;
        }

        auto it = actor_index.find(actor_id);
        if (it == actor_index.end())
        {
            if (error)
                *error = "unknown actor: " + actor_id;
            return false;
        }
        Actor &actor = actors[it->second];
        if (actor.released)
        {
            if (error)
                *error = "actor already released: " + actor_id;
            return false;
        }
        actor.released = true;
        actor.speed = 0.0;
        return true;
    }

} // namespace edgesim
