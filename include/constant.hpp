#pragma once
// Window
#define SCREEN_WIDTH 1280
#define SCREEN_HEIGHT 720
#define TARGET_FPS 60

// Board
#define DEFAULT_GRID_SIZE 5
#define MAX_GRID_SIZE 50
#define DEFAULT_POOL_SIZE 3
#define BODY_TYPE_COUNT 3

// Spawn timing (seconds), clamped to [0, MAX_SPAWN_SLIDER]
#define DEFAULT_SPAWN_WAIT_TIME 1.0f
#define DEFAULT_SPAWN_SPEED 1.0f
#define MAX_SPAWN_SLIDER 5.0f
#define DEFAULT_SPAWN_ANIMATION_TIME 0.5f
#define DEFAULT_DEATH_ANIMATION_TIME 0.5f

// Hit animations
#define HIT_ANIMATION_TIME 0.3f
#define LIGHT_PUNCH_SCALE {-0.3f, 0.6f, -0.3f}
#define HEAVY_PUNCH_SCALE {0.3f, -0.6f, 0.3f}

// Damage
#define HEALTH_PER_BODY_SIZE 3
#define LIGHT_HIT_DAMAGE 1
#define HEAVY_HIT_DAMAGE 2

// Orbit camera, degrees per frame
#define DEFAULT_ORBIT_SPEED 0.2f
#define CAMERA_PULLBACK 10.0f
#define PICK_DISTANCE 1000.0f

#define PLAIN_ENEMY_COLOR {200, 200, 200, 255}
#define BOARD_COLOR {40, 44, 52, 255}
#define BOARD_LINE_COLOR {90, 96, 110, 255}
#define SKY_COLOR {12, 17, 32, 255}

#define CONFIG_FILENAME "whackgrid_config.txt"
